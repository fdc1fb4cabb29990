#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "src/clump/config/config.hpp"
#include "src/clump/dispatcher/dispatcher.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/client/curl_transport.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/model/model.hpp"

namespace {
    void print_usage() { std::cerr << "usage: clump [--collect] <METHOD> <URL> [JSON-BODY] [<METHOD> <URL> [JSON-BODY]]..." << std::endl; }

    std::vector<http::model::RequestDescriptor> parse_requests(const std::vector<std::string>& args) {
        std::vector<http::model::RequestDescriptor> requests;

        for (size_t i = 0; i < args.size();) {
            if (i + 1 >= args.size()) {
                throw http::http_error::ConstructionError("Missing URL after " + args[i]);
            }

            const std::string& verb = args[i];
            const std::string& url = args[i + 1];
            i += 2;

            std::optional<http::model::StructuredMap> body;
            if (i < args.size() && !args[i].empty() && (args[i].front() == '{' || args[i].front() == '[')) {
                body = http::model::StructuredMap::parse(args[i]);
                ++i;
            }

            requests.push_back(http::model::RequestDescriptor::from_verb(url, verb, std::move(body)));
        }

        return requests;
    }

    void print_outcome(const http::model::Outcome& outcome) {
        std::cout << http::model::to_string(outcome.request().method()) << " " << outcome.request().url() << " -> " << outcome.status_code();
        if (outcome.body()) {
            std::cout << " " << http::model::to_display_string(*outcome.body());
        }
        if (outcome.error()) {
            std::cout << " [" << http::model::to_string(outcome.error()->kind_) << " error: " << outcome.error()->message_ << "]";
        }
        std::cout << "\n";
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        std::vector<std::string> args(argv + 1, argv + argc);
        bool collect_errors = false;
        if (!args.empty() && args.front() == "--collect") {
            collect_errors = true;
            args.erase(args.begin());
        }

        if (args.empty()) {
            print_usage();
            return 1;
        }

        const clump::config::Config config = clump::config::load_from_env();
        clump::config::apply(config);

        http::client::CurlGlobal curl_global;

        const std::vector<http::model::RequestDescriptor> requests = parse_requests(args);

        auto dispatcher = clump::DispatcherBuilder()
                              .with_transport_factory(http::client::make_curl_transport_factory(config.transport_))
                              .with_options(config.dispatcher_)
                              .validate()
                              .build();

        //
        // Dispatch
        //

        const clump::AggregateResult result = dispatcher->dispatch(requests, collect_errors);

        for (const auto& outcome : result.outcomes_) {
            print_outcome(outcome);
        }
        for (const auto& task_exception : result.exceptions_) {
            std::cout << "#" << task_exception.index_ << " " << task_exception.request_->url() << " failed: " << task_exception.error_.message_ << "\n";
        }
        std::cout.flush();
    } catch (const http::http_error::ConstructionError& e) {
        std::cerr << "Invalid request: " << e.what() << std::endl;
        print_usage();
        return 1;
    } catch (const http::http_error::TransportError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
