#pragma once

#include <flow/exceptions.hpp>
#include <flow/manual_completion.hpp>
#include <reporting/events.hpp>
#include <util/strings.hpp>
#include <util/terminal.hpp>

#include <di.hpp>
#include <fmt/color.h>
#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Text front end for a session
 *
 * Interactive mode reads one command per line; batch mode applies the
 * pre-supplied manual completions and runs to the first point where
 * nothing more can happen without the user.
 */
template <typename SessionType, typename ReportEngineType>
class Console {
    using session_t   = SessionType;
    using reporting_t = ReportEngineType;
    using services_t  = di::Deps<session_t, reporting_t>;
    using outcome_t   = typename session_t::Outcome;

    services_t services_;
    std::reference_wrapper<std::istream> in_;
    std::reference_wrapper<std::ostream> out_;

public:
    Console(services_t services, std::istream &in, std::ostream &out)
        : services_{ services }
        , in_{ std::ref(in) }
        , out_{ std::ref(out) } { }

    // 0 when every step completed, 2 when waiting on manual steps, 1 when a step failed
    static int exit_code(outcome_t const &outcome) {
        switch(outcome.type) {
        case outcome_t::Type::DONE:
            return 0;
        case outcome_t::Type::WAITING:
            return 2;
        case outcome_t::Type::FAILED:
            return 1;
        }
        return 1;
    }

    int run_interactive(std::vector<ManualCompletion> const &completions = {}) {
        prompt_inputs();
        apply(completions);
        pass();

        for(std::string line;;) {
            out_.get() << "oxflow> " << std::flush;
            if(not std::getline(in_.get(), line))
                break;
            if(not execute(line))
                break;
        }

        return exit_code(session().outcome());
    }

    // throws SessionError when a completion is rejected
    int run_batch(std::vector<ManualCompletion> const &completions) {
        apply(completions);

        auto const outcome = pass();
        auto const tally   = reporting().tally();
        report(SimpleEvent{ "SUMMARY", fmt::format("{} succeeded, {} failed", tally.successes, tally.failures) });

        if(not outcome.waiting.empty())
            report(SimpleEvent{ "WAITING", fmt::format("{}", fmt::join(outcome.waiting, ", ")) });
        return exit_code(outcome);
    }

    // asks for every declared input that has no value yet; an empty answer leaves it unset.
    // secret inputs typed on a terminal are not echoed.
    void prompt_inputs() {
        auto &current = session();

        for(auto const &input : current.graph().inputs()) {
            if(current.context().inputs.contains(input.name))
                continue;

            auto notes = std::vector<std::string>{};
            if(not input.description.empty())
                notes.push_back(input.description);
            if(input.secret)
                notes.push_back("hidden");
            out_.get() << fmt::format("{}{}: ", input.name, notes.empty() ? "" : fmt::format(" ({})", fmt::join(notes, ", "))) << std::flush;

            std::string value;
            {
                auto const echo = util::HiddenEcho{ input.secret and &in_.get() == &std::cin };
                if(not std::getline(in_.get(), value))
                    return;
                if(echo.active())
                    out_.get() << '\n';
            }
            if(value = util::trim(value); not value.empty())
                current.set_input(input.name, value);
        }
    }

    /**
     * @brief Executes one console command
     *
     * Rejected commands are printed and leave the session untouched.
     *
     * @return false once the user asked to quit
     */
    bool execute(std::string const &line) {
        auto const words = util::split_words(line);
        if(words.empty())
            return true;

        auto const &command = words.front();
        auto const args     = std::vector<std::string>{ std::next(std::begin(words)), std::end(words) };

        try {
            if(command == "quit" or command == "exit") {
                return false;
            } else if(command == "help") {
                help();
            } else if(command == "status" or command == "run") {
                pass();
            } else if(command == "complete") {
                auto const &id = argument(args, "complete <id> [name=value ...]");
                auto fields    = parse_fields({ std::next(std::begin(args)), std::end(args) });
                session().complete(id, std::move(fields));
                pass();
            } else if(command == "retry") {
                session().retry(argument(args, "retry <id>"));
                pass();
            } else if(command == "restart") {
                session().restart(argument(args, "restart <id>"));
                pass();
            } else if(command == "show") {
                report(session().detail(argument(args, "show <id>")));
            } else if(command == "input") {
                if(args.size() < 2)
                    throw std::invalid_argument{ "usage: input <name> <value>" };
                session().set_input(args[0], fmt::format("{}", fmt::join(std::next(std::begin(args)), std::end(args), " ")));
                pass();
            } else {
                throw std::invalid_argument{ fmt::format("unknown command '{}'; try help", command) };
            }
        } catch(SessionError const &e) {
            error(e.what());
        } catch(std::invalid_argument const &e) {
            error(e.what());
        }

        return true;
    }

private:
    // each completion follows a scheduling pass so that its step had the chance to become eligible
    void apply(std::vector<ManualCompletion> const &completions) {
        auto &current = session();
        current.run();

        for(auto const &completion : completions) {
            current.complete(completion.step, completion.fields);
            current.run();
        }
    }

    outcome_t pass() {
        auto const outcome = session().run();
        report(StatusEvent{ session().status_rows() });
        return outcome;
    }

    void help() {
        out_.get() << "Commands:\n"
                      "  status                           show every step and its state\n"
                      "  run                              execute every eligible automatic step\n"
                      "  complete <id> [name=value ...]   complete a manual step with the given fields\n"
                      "  retry <id>                       attempt a failed step again\n"
                      "  restart <id>                     clear a step and everything that depends on it\n"
                      "  show <id>                        print a step's response and fields\n"
                      "  input <name> <value>             set a session input\n"
                      "  quit                             leave\n";
    }

    void error(std::string const &message) {
        out_.get() << fmt::format(fg(fmt::color::red) | fmt::emphasis::bold, "error: ") << message << '\n';
    }

    static std::string const &argument(std::vector<std::string> const &args, std::string_view usage) {
        if(args.empty())
            throw std::invalid_argument{ fmt::format("usage: {}", usage) };
        return args.front();
    }

    session_t &session() {
        return services_.template get<session_t>().get();
    }

    reporting_t &reporting() {
        return services_.template get<reporting_t>().get();
    }

    void report(auto &&ev) {
        reporting().record(std::move(ev));
    }
};
