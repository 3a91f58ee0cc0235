#include "log_record.hpp"
#include <chrono>
#include "time_utils.hpp"

namespace syncguard {

void to_json(nlohmann::json& j, const TransferDetail& d) {
    j = nlohmann::json{{"source", d.source},
                       {"destination", d.destination},
                       {"options", d.options},
                       {"option_list", d.option_list},
                       {"output", d.output},
                       {"start_time", d.start_time},
                       {"end_time", d.end_time},
                       {"duration", d.duration},
                       {"duration_ms", d.duration_ms},
                       {"exit_code", d.exit_code}};
}

void from_json(const nlohmann::json& j, TransferDetail& d) {
    j.at("source").get_to(d.source);
    j.at("destination").get_to(d.destination);
    j.at("options").get_to(d.options);
    d.option_list = j.value("option_list", std::vector<std::string>{});
    j.at("output").get_to(d.output);
    j.at("start_time").get_to(d.start_time);
    j.at("end_time").get_to(d.end_time);
    j.at("duration").get_to(d.duration);
    d.duration_ms = j.value("duration_ms", std::int64_t{0});
    d.exit_code = j.value("exit_code", 0);
}

void to_json(nlohmann::json& j, const LogRecord& r) {
    j = nlohmann::json{{"timestamp", r.timestamp},
                       {"invocation_id", r.invocation_id},
                       {"status", record_status_name(r.status)},
                       {"message", r.message},
                       {"detail", r.detail}};
}

void from_json(const nlohmann::json& j, LogRecord& r) {
    j.at("timestamp").get_to(r.timestamp);
    j.at("invocation_id").get_to(r.invocation_id);
    r.status = parse_record_status(j.at("status").get<std::string>());
    j.at("message").get_to(r.message);
    j.at("detail").get_to(r.detail);
}

LogRecord build_record(const Invocation& inv, const Classification& cls) {
    LogRecord rec;
    rec.timestamp = iso8601_utc(std::chrono::system_clock::now());
    rec.invocation_id = inv.id;
    rec.status = cls.status;
    rec.message = cls.message;
    rec.detail.source = inv.source;
    rec.detail.destination = inv.destination;
    rec.detail.options = inv.options_string();
    rec.detail.option_list = inv.options;
    rec.detail.output = inv.output;
    rec.detail.start_time = iso8601_utc(inv.start_time);
    rec.detail.end_time = iso8601_utc(inv.end_time);
    rec.detail.duration = format_duration_hms(inv.duration);
    rec.detail.duration_ms = static_cast<std::int64_t>(inv.duration.count());
    rec.detail.exit_code = inv.exit_status;
    return rec;
}

std::string serialize_record(const LogRecord& record) {
    nlohmann::json j = record;
    std::string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';
    return line;
}

LogRecord parse_record(const std::string& line) {
    return nlohmann::json::parse(line).get<LogRecord>();
}

} // namespace syncguard
