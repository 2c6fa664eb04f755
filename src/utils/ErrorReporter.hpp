#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // logging, command line, input files
    Configuration,  // TOML parsing, invalid config entries
    Matching,       // keyword / price pattern degradations
    Storage,        // match file persistence
    Notification,   // notification delivery
    Unknown
};

enum class ErrorSeverity
{
    Warning, // degraded, processing continues
    Error,   // one operation failed, processing continues
    Fatal    // the run cannot produce a useful result
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message;
    std::string details;
    std::string timestamp; // local time, "%Y-%m-%d %H:%M:%S"
};

// Reports counted since the last ClearErrors(), independent of the queue bound
struct ErrorTally
{
    std::size_t warnings = 0;
    std::size_t errors = 0;
    std::size_t fatals = 0;

    [[nodiscard]] bool hasFatal() const noexcept { return fatals > 0; }
};

/**
 * @brief Process-wide sink for degraded or failed operations.
 *
 * Every report is written to the main plog logger and queued; the queue keeps
 * the newest kMaxQueued reports for the caller to inspect. The tally keeps
 * counting past that bound, so the end-of-run summary is always exact.
 * All members are thread-safe.
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxQueued = 100;

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");

    static bool HasPendingErrors();

    // Returns the queued reports, oldest first, and empties the queue
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorTally Tally();

    // Empties the queue and resets the tally
    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);

private:
    static void Record(ErrorSeverity severity, ErrorCategory category, const std::string& message,
                       const std::string& details);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static ErrorTally s_tally;
};

} // namespace utils
