#pragma once

#include <web/http.hpp>

#include <inja/inja.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct MetaEvent {
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
};

struct SimpleEvent : public MetaEvent {
    SimpleEvent(std::string const &label, std::string const &message)
        : MetaEvent{}
        , label{ label }
        , message{ message } {
    }
    std::string label;
    std::string message;
};

struct SuccessEvent : public MetaEvent {
    SuccessEvent(
        std::string const &step,
        std::string const &title,
        inja::json const &fields)
        : MetaEvent{}
        , step{ step }
        , title{ title }
        , fields{ fields } { }
    std::string step;
    std::string title;
    inja::json fields;
};

struct FailureEvent : public MetaEvent {
    struct Data {
        enum class Type {
            SUBSTITUTION,
            TRANSPORT,
            HTTP_STATUS,
        };
        Data(
            Type type,
            std::string const &path,
            std::string const &message,
            std::string const &detail = "")
            : type{ type }
            , path{ path }
            , message{ message }
            , detail{ detail } { }
        Type type;
        std::string path;
        std::string message;
        std::string detail;
    };

    FailureEvent(
        std::string const &step,
        std::vector<Data> const &issues,
        std::string const &response)
        : MetaEvent{}
        , step{ step }
        , issues{ issues }
        , response{ response } { }
    std::string step;
    std::vector<Data> issues;
    std::string response;
};

struct RequestEvent : public MetaEvent {
    RequestEvent(
        std::string const &step,
        HttpRequest const &request)
        : MetaEvent{}
        , step{ step }
        , request{ request } { }
    std::string step;
    HttpRequest request;
};

struct ResponseEvent : public MetaEvent {
    ResponseEvent(
        std::string const &step,
        HttpResponse const &response)
        : MetaEvent{}
        , step{ step }
        , response{ response } { }
    std::string step;
    HttpResponse response;
};

// a manual step became eligible and waits for an external completion signal
struct ManualStepEvent : public MetaEvent {
    ManualStepEvent(
        std::string const &step,
        std::string const &title,
        std::string const &description,
        std::string const &instructions)
        : MetaEvent{}
        , step{ step }
        , title{ title }
        , description{ description }
        , instructions{ instructions } { }
    std::string step;
    std::string title;
    std::string description;
    std::string instructions;
};

struct StatusEvent : public MetaEvent {
    struct Row {
        std::string step;
        std::string title;
        std::string state; // completed, failed, running, candidate or blocked
        bool manual;
        std::vector<std::string> waiting_on;
    };

    explicit StatusEvent(std::vector<Row> const &rows)
        : MetaEvent{}
        , rows{ rows } { }
    std::vector<Row> rows;
};

struct StepDetailEvent : public MetaEvent {
    std::string step;
    std::string title;
    std::string state;
    std::optional<unsigned> http_status;
    std::string http_reason;
    std::string error;
    inja::json fields;
    std::string response;
    std::string request_template;
};
