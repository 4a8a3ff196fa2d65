#include "notification.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <format>
#include <stdexcept>

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t left = state->payload->size() - state->offset;
    size_t count = std::min(room, left);
    if (count > 0) {
        std::memcpy(buffer, state->payload->data() + state->offset, count);
        state->offset += count;
    }
    return count;
}

std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string rfc5322Date() {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char dateBuf[64];
    std::strftime(dateBuf, sizeof(dateBuf), "%a, %d %b %Y %H:%M:%S +0000", std::gmtime(&timeT));
    return dateBuf;
}

} // namespace

std::vector<std::string> splitRecipients(const std::string& recipients) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start <= recipients.size()) {
        auto comma = recipients.find(',', start);
        if (comma == std::string::npos) {
            comma = recipients.size();
        }
        auto address = trim(recipients.substr(start, comma - start));
        if (!address.empty()) {
            result.push_back(address);
        }
        start = comma + 1;
    }
    return result;
}

EmailNotificationStrategy::EmailNotificationStrategy(const Json::Value& config)
    : smtpServer(config.get("smtp_server", "smtp://smtp.office365.com:587").asString()),
      username(config.get("username", "").asString()),
      password(config.get("password", "").asString()),
      from(config.get("from", config.get("username", "").asString()).asString()),
      subject(config.get("subject", "SFTPMail transfer failure").asString()) {
    const Json::Value& to = config["recipients"];
    if (to.isArray()) {
        for (const auto& address : to) {
            recipients.push_back(trim(address.asString()));
        }
    } else if (to.isString()) {
        recipients = splitRecipients(to.asString());
    }
    if (from.empty()) {
        throw std::runtime_error("Email configuration needs a 'from' address or a 'username'");
    }
}

std::string EmailNotificationStrategy::composeMessage(const std::vector<std::string>& to, const std::string& subjectLine,
                                                      const std::string& body) const {
    std::string message = std::format("Date: {}\r\nFrom: <{}>\r\n", rfc5322Date(), from);
    if (!to.empty()) {
        message += std::format("To: <{}>\r\n", to.front());
    }
    if (to.size() > 1) {
        std::string cc;
        for (size_t i = 1; i < to.size(); ++i) {
            cc += std::format("{}<{}>", cc.empty() ? "" : ", ", to[i]);
        }
        message += std::format("Cc: {}\r\n", cc);
    }
    message += std::format("Subject: {}\r\nContent-Type: text/plain; charset=UTF-8\r\n\r\n", subjectLine);

    // SMTP requires CRLF line endings in the body as well.
    for (char c : body) {
        if (c == '\n') {
            message += "\r\n";
        } else if (c != '\r') {
            message += c;
        }
    }
    message += "\r\n";
    return message;
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::vector<std::string>& to,
                                                                   const std::string& subjectLine,
                                                                   const std::string& body) {
    const auto& targets = to.empty() ? recipients : to;
    if (targets.empty()) {
        return std::unexpected("No email recipients configured");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string payload = composeMessage(targets, subjectLine, body);
    UploadState state{&payload, 0};
    std::string mailFrom = std::format("<{}>", from);

    struct curl_slist* rcpt = nullptr;
    for (const auto& address : targets) {
        rcpt = curl_slist_append(rcpt, std::format("<{}>", address).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, smtpServer.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    if (!username.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, password.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, rcpt);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(rcpt);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send email notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

std::expected<void, QueueError> EmailNotificationStrategy::verifyCredentials() const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(QueueError{ErrorKind::Configuration, smtpServer, "Failed to initialize CURL"});
    }

    curl_easy_setopt(curl, CURLOPT_URL, smtpServer.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_USERNAME, username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, password.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(QueueError{ErrorKind::Authentication, smtpServer,
                                          std::format("Failed to authenticate: {}", curl_easy_strerror(res))});
    }
    return {};
}
