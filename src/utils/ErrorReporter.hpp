#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, tool startup
    Configuration,  // TOML parsing, invalid config
    KeyCollision,   // two default texts derived the same key
    Resolution,     // label lookup / creation
    Pattern,        // message pattern parse or format failures
    Store,          // label store collaborator failures
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but engine can continue
    Fatal    // Critical error, tool should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Technical details for logs/bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter shared by the engine and the tool
 *
 * Collects errors from the engine subsystems and queues them for whoever
 * embeds the engine (admin surface, CLI). Every report is logged through plog.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::KeyCollision,
 *                                "Label key derived from two different texts",
 *                                "bot_greetings_hello");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *       // Surface them...
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Short message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a fatal error (logs and queues)
     */
    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a regular error
     */
    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a warning
     */
    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors, move them to the history and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::vector<ErrorReport> GetHistorySnapshot();
    static void ClearHistory();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void AppendToHistoryLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::vector<ErrorReport> s_error_history;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
    static constexpr size_t MAX_HISTORY_SIZE = 500;
};

} // namespace utils
