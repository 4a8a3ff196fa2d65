/**
 * @file notification.hpp
 * @brief Defines notification strategies for SFTPMail.
 *
 * Provides the interface the transfer queue uses to raise operational alerts, and an
 * email implementation. Designed for cross-platform use, with dependencies managed via libcurl.
 *
 * @note Requires libcurl with SMTP support. Install via vcpkg on Windows, Homebrew on macOS,
 * or apt on Linux.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <vector>
#include <expected>
#include <json/json.h>
#include "queue_error.hpp"

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for sending operational alerts about queue failures.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param recipients Addresses to notify; an empty list uses the configured default.
     * @param subject Subject line.
     * @param body Plain-text body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::vector<std::string>& recipients,
                                                    const std::string& subject,
                                                    const std::string& body) = 0;

    /**
     * @brief Recipients used when notify() is called with an empty list.
     */
    virtual std::vector<std::string> defaultRecipients() const = 0;

    /**
     * @brief Subject used for queue failure alerts.
     */
    virtual std::string defaultSubject() const = 0;
};

/**
 * @brief Splits a comma separated address list, trimming blanks and dropping empty entries.
 */
std::vector<std::string> splitRecipients(const std::string& recipients);

/**
 * @brief Email notification strategy.
 *
 * Sends plain-text alerts over SMTP with STARTTLS. The first recipient is addressed in
 * "To", the remaining ones in "Cc".
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param config JSON configuration with smtp_server, username, password, from,
     * recipients (comma separated string or array) and subject.
     * @throws std::runtime_error If no sender address can be determined.
     */
    explicit EmailNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::vector<std::string>& recipients,
                                            const std::string& subject,
                                            const std::string& body) override;

    std::vector<std::string> defaultRecipients() const override { return recipients; }
    std::string defaultSubject() const override { return subject; }

    /**
     * @brief Connects and logs in to the SMTP server without sending anything.
     *
     * @return std::expected<void, QueueError> Success or an AuthenticationError.
     */
    std::expected<void, QueueError> verifyCredentials() const;

    /**
     * @brief Builds the RFC 5322 message sent by notify().
     */
    std::string composeMessage(const std::vector<std::string>& to, const std::string& subjectLine,
                               const std::string& body) const;

private:
    std::string smtpServer; ///< SMTP server URL (e.g., "smtp://smtp.office365.com:587").
    std::string username; ///< SMTP login.
    std::string password; ///< SMTP password.
    std::string from; ///< Sender address.
    std::vector<std::string> recipients; ///< Default recipients.
    std::string subject; ///< Default subject.
};

#endif // NOTIFICATION_HPP
