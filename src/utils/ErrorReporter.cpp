#include "ErrorReporter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;
ErrorTally ErrorReporter::s_tally;

namespace
{

std::string local_time_now()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

plog::Severity plog_severity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // anonymous namespace

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Record(ErrorSeverity::Warning, category, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Record(ErrorSeverity::Error, category, message, details);
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    Record(ErrorSeverity::Fatal, category, message, details);
}

void ErrorReporter::Record(ErrorSeverity severity, ErrorCategory category, const std::string& message,
                           const std::string& details)
{
    PLOG(plog_severity(severity)) << "[" << CategoryToString(category) << "] " << message
                                  << (details.empty() ? "" : " (") << details << (details.empty() ? "" : ")");

    ErrorReport report{ category, severity, message, details, local_time_now() };

    std::lock_guard<std::mutex> lock(s_mutex);
    switch (severity)
    {
    case ErrorSeverity::Warning:
        ++s_tally.warnings;
        break;
    case ErrorSeverity::Error:
        ++s_tally.errors;
        break;
    case ErrorSeverity::Fatal:
        ++s_tally.fatals;
        break;
    }

    if (s_queue.size() == kMaxQueued)
        s_queue.erase(s_queue.begin());
    s_queue.push_back(std::move(report));
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return std::exchange(s_queue, {});
}

ErrorTally ErrorReporter::Tally()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_tally;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_tally = {};
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Matching:
        return "Matching";
    case ErrorCategory::Storage:
        return "Storage";
    case ErrorCategory::Notification:
        return "Notification";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

} // namespace utils
