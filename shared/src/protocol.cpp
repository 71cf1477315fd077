#include "bytebeam/protocol.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "bytebeam/encoding/url.hpp"

namespace bytebeam::protocol
{

    namespace
    {

        struct TransferStateMapping
        {
            TransferState state;
            std::string_view label;
        };

        constexpr std::array<TransferStateMapping, 4> kStateMappings{{
            {TransferState::NotStarted, "NotStarted"},
            {TransferState::InProgress, "InProgress"},
            {TransferState::Done, "Done"},
            {TransferState::Failed, "Failed"},
        }};

    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "Unknown";
    }

    std::optional<TransferState> transfer_state_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.label == value)
            {
                return mapping.state;
            }
        }
        return std::nullopt;
    }

    std::string format_timestamp(Timestamp time)
    {
        using namespace std::chrono;
        const auto since_epoch = time.time_since_epoch();
        const auto whole = floor<seconds>(since_epoch);
        const auto millis = duration_cast<milliseconds>(since_epoch - whole).count();
        const auto raw = static_cast<std::time_t>(whole.count());
        std::tm utc{};
        gmtime_r(&raw, &utc);
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return oss.str();
    }

    Timestamp parse_timestamp(std::string_view text)
    {
        std::tm utc{};
        std::istringstream iss{std::string(text)};
        iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
        if (iss.fail())
        {
            throw std::runtime_error("Invalid timestamp: " + std::string(text));
        }
        long millis = 0;
        if (iss.peek() == '.')
        {
            iss.get();
            std::string fraction;
            while (std::isdigit(iss.peek()))
            {
                fraction.push_back(static_cast<char>(iss.get()));
            }
            fraction.resize(3, '0');
            millis = std::stol(fraction);
        }
        const auto seconds = timegm(&utc);
        return Timestamp{std::chrono::seconds{seconds}} + std::chrono::milliseconds{millis};
    }

    SessionSnapshot redact(SessionSnapshot snapshot)
    {
        snapshot.upload_key.reset();
        snapshot.download_lock.reset();
        return snapshot;
    }

    std::string upload_url(const SessionSnapshot &snapshot)
    {
        if (!snapshot.upload_key)
        {
            return {};
        }
        auto url = "/" + snapshot.path + "/" + *snapshot.upload_key;
        if (snapshot.download_lock)
        {
            url += "?download_lock=" + encoding::url_encode(*snapshot.download_lock);
        }
        return url;
    }

    std::string download_url(const SessionSnapshot &snapshot)
    {
        return "/" + snapshot.path;
    }

    void to_json(nlohmann::json &json, const SessionSnapshot &snapshot)
    {
        json = {
            {"file_name", snapshot.file_name},
            {"file_size", snapshot.file_size},
            {"path", snapshot.path},
            {"upload", std::string(to_string(snapshot.upload))},
            {"download", std::string(to_string(snapshot.download))},
            {"created", format_timestamp(snapshot.created)},
            {"accessed", format_timestamp(snapshot.accessed)},
            {"reverse", snapshot.reverse},
            {"compression", snapshot.compression},
            {"download_url", download_url(snapshot)},
        };
        if (snapshot.upload_key)
        {
            json["upload_key"] = *snapshot.upload_key;
            json["upload_url"] = upload_url(snapshot);
        }
        if (snapshot.download_lock)
        {
            json["download_lock"] = *snapshot.download_lock;
        }
    }

    void from_json(const nlohmann::json &json, SessionSnapshot &snapshot)
    {
        snapshot.file_name = json.value("file_name", std::string{});
        snapshot.file_size = json.value("file_size", 0ULL);
        snapshot.path = json.at("path").get<std::string>();
        if (auto it = json.find("upload_key"); it != json.end())
        {
            snapshot.upload_key = it->get<std::string>();
        }
        else
        {
            snapshot.upload_key.reset();
        }
        if (auto it = json.find("download_lock"); it != json.end())
        {
            snapshot.download_lock = it->get<std::string>();
        }
        else
        {
            snapshot.download_lock.reset();
        }
        const auto upload_label = json.at("upload").get<std::string>();
        const auto download_label = json.at("download").get<std::string>();
        const auto upload = transfer_state_from_string(upload_label);
        const auto download = transfer_state_from_string(download_label);
        if (!upload || !download)
        {
            throw std::runtime_error("Unknown transfer state: " + (upload ? download_label : upload_label));
        }
        snapshot.upload = *upload;
        snapshot.download = *download;
        snapshot.created = parse_timestamp(json.at("created").get<std::string>());
        snapshot.accessed = parse_timestamp(json.at("accessed").get<std::string>());
        snapshot.reverse = json.value("reverse", false);
        snapshot.compression = json.value("compression", std::string{"none"});
    }

    void to_json(nlohmann::json &json, const ErrorEnvelope &envelope)
    {
        json = {
            {"status", std::string(to_string(envelope.error))},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
        };
        if (envelope.session)
        {
            json["session"] = *envelope.session;
        }
        else
        {
            json["session"] = nullptr;
        }
    }

    void from_json(const nlohmann::json &json, ErrorEnvelope &envelope)
    {
        const auto error_value = json.value("error", to_int(ErrorCode::InternalError));
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        if (auto it = json.find("session"); it != json.end() && !it->is_null())
        {
            envelope.session = it->get<SessionSnapshot>();
        }
        else
        {
            envelope.session.reset();
        }
    }

} // namespace bytebeam::protocol
