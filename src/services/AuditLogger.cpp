#include "services/AuditLogger.hpp"

#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <glib.h>
#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

auto audit_error(const std::string& message, int err = 0) -> WipeError {
    return WipeError{ErrorKind::AuditWriteFailed, WipeStage::Audit, message, err};
}

template <typename T, typename ToJson>
auto nullable(const std::optional<T>& value, ToJson to_json) -> json {
    return value ? to_json(*value) : json(nullptr);
}

}  // namespace

JsonlAuditLogger::JsonlAuditLogger(fs::path log_path, std::optional<AuditIdentity> identity)
    : log_path_(std::move(log_path)),
      identity_(identity ? std::move(*identity) : session_identity()) {}

auto JsonlAuditLogger::session_identity() -> AuditIdentity {
    const gchar* user = g_get_user_name();
    const gchar* host = g_get_host_name();
    return AuditIdentity{user != nullptr ? user : "unknown", host != nullptr ? host : "unknown"};
}

auto JsonlAuditLogger::default_path() -> fs::path {
    return fs::path{g_get_user_data_dir()} / "file-sanitizer" / DEFAULT_FILE_NAME;
}

auto JsonlAuditLogger::serialize(const AuditRecord& record) -> std::string {
    const auto& result = record.result;
    auto as_name = [](auto value) { return json(std::string(to_string(value))); };

    json line = {
        {"timestamp_utc", record.timestamp_utc},
        {"path", result.path.string()},
        {"size_bytes", result.size_bytes},
        {"sha256_before", result.sha256_before},
        {"standard_used", std::string(to_string(result.standard_used))},
        {"passes_executed", result.passes_executed},
        {"verified", nullable(result.verified, [](bool v) { return json(v); })},
        {"duration_seconds", result.duration_seconds},
        {"success", result.success},
        {"error_kind", nullable(result.error_kind, as_name)},
        {"error_stage", nullable(result.error_stage, as_name)},
        {"error_message",
         result.error_message.empty() ? json(nullptr) : json(result.error_message)},
        {"strategy_label", result.strategy_label},
        {"user", record.user},
        {"hostname", record.hostname},
    };
    // Keep one record per line even if a path contains invalid UTF-8
    return line.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto JsonlAuditLogger::parse(const std::string& line) -> std::optional<AuditRecord> {
    const auto doc = json::parse(line, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    try {
        AuditRecord record;
        record.timestamp_utc = doc.at("timestamp_utc").get<std::string>();
        record.user = doc.at("user").get<std::string>();
        record.hostname = doc.at("hostname").get<std::string>();

        auto& result = record.result;
        result.path = doc.at("path").get<std::string>();
        result.size_bytes = doc.at("size_bytes").get<uint64_t>();
        result.sha256_before = doc.at("sha256_before").get<std::string>();
        result.passes_executed = doc.at("passes_executed").get<int>();
        result.duration_seconds = doc.at("duration_seconds").get<double>();
        result.success = doc.at("success").get<bool>();
        result.strategy_label = doc.at("strategy_label").get<std::string>();

        const auto standard = parse_standard(doc.at("standard_used").get<std::string>());
        if (!standard) {
            return std::nullopt;
        }
        result.standard_used = *standard;

        if (const auto& verified = doc.at("verified"); !verified.is_null()) {
            result.verified = verified.get<bool>();
        }
        if (const auto& kind = doc.at("error_kind"); !kind.is_null()) {
            result.error_kind = parse_error_kind(kind.get<std::string>());
        }
        if (const auto& stage = doc.at("error_stage"); !stage.is_null()) {
            result.error_stage = parse_wipe_stage(stage.get<std::string>());
        }
        if (const auto& message = doc.at("error_message"); !message.is_null()) {
            result.error_message = message.get<std::string>();
        }
        return record;
    } catch (const json::exception&) {
        // Missing key or wrong type
        return std::nullopt;
    }
}

auto JsonlAuditLogger::ensure_open_locked() -> std::expected<void, WipeError> {
    if (fd_) {
        return {};
    }

    std::error_code ec;
    if (const auto parent = log_path_.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(
                audit_error("create " + parent.string() + ": " + ec.message(), ec.value()));
        }
    }

    auto fd = util::FileDescriptor::open(log_path_, O_WRONLY | O_CREAT | O_APPEND, 0600);
    if (!fd) {
        return std::unexpected(audit_error(fd.error().message, fd.error().code));
    }
    fd_ = std::move(*fd);
    return {};
}

auto JsonlAuditLogger::append(const AuditRecord& record) -> std::expected<void, WipeError> {
    auto line = serialize(record);
    line.push_back('\n');

    std::lock_guard lock(mutex_);
    if (auto opened = ensure_open_locked(); !opened) {
        LOG_ERROR("AuditLogger", opened.error().message);
        return opened;
    }

    const auto end = ::lseek(fd_.get(), 0, SEEK_END);
    if (end < 0) {
        auto error = util::Error::from_errno("lseek " + log_path_.string());
        LOG_ERROR("AuditLogger", error.message);
        return std::unexpected(audit_error(error.message, error.code));
    }

    // A single write keeps the line contiguous under O_APPEND
    const auto written = util::write_with_retry(fd_.get(), line.data(), line.size());
    if (written < 0 || static_cast<size_t>(written) != line.size()) {
        auto error = written < 0 ? util::Error::from_errno("write " + log_path_.string())
                                 : util::Error{"short write to " + log_path_.string(), EIO};
        LOG_ERROR("AuditLogger", error.message);
        // Drop the partial line so the log stays one record per line
        if (written > 0 && ::ftruncate(fd_.get(), end) != 0) {
            LOG_ERROR("AuditLogger",
                      util::Error::from_errno("ftruncate " + log_path_.string()).message);
        }
        return std::unexpected(audit_error(error.message, error.code));
    }

    if (auto synced = util::fsync_with_retry(fd_.get()); !synced) {
        LOG_ERROR("AuditLogger", synced.error().message);
        return std::unexpected(audit_error(synced.error().message, synced.error().code));
    }

    LOG_DEBUG("AuditLogger", "recorded " + record.result.path.string());
    return {};
}

auto JsonlAuditLogger::read_records() const -> std::expected<std::vector<AuditRecord>, WipeError> {
    std::vector<AuditRecord> records;

    std::ifstream file{log_path_};
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(log_path_, ec)) {
            return records;
        }
        return std::unexpected(audit_error("cannot read " + log_path_.string()));
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        if (auto record = parse(line)) {
            records.push_back(std::move(*record));
        } else {
            LOG_WARNING("AuditLogger", log_path_.string() + ":" + std::to_string(line_number) +
                                           ": skipping malformed record");
        }
    }
    return records;
}
