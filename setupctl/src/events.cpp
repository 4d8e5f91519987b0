#include "events.hpp"

#include "localization.hpp"
#include "utils.hpp"

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

void LogEventSink::publish(const InstallerEvent& event) {
    std::visit(overloaded{
        [](const InitializationEvent& e) { log_info(string_format("event.initialization", e.package_id)); },
        [](const ExecutingEvent& e) { log_info(string_format("event.executing", e.package_id)); },
        [](const SuccessEvent& e) { log_info(string_format("event.success", e.package_id)); },
    }, event);
}
