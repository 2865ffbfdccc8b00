#include "Job.hpp"
#include <sstream>

namespace BulkBridge
{

    JobStatus parse_status(const std::optional<Job> &job)
    {
        if (!job)
            return JobStatus::Unknown;
        if (job->error_result)
            return JobStatus::Failed;
        if (!job->errors.empty())
            return JobStatus::Failed;
        return JobStatus::Succeeded;
    }

    std::string_view to_string(JobStatus status)
    {
        switch (status)
        {
        case JobStatus::Succeeded:
            return "SUCCEEDED";
        case JobStatus::Failed:
            return "FAILED";
        case JobStatus::Unknown:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    std::string_view to_string(JobType type)
    {
        switch (type)
        {
        case JobType::Load:
            return "load";
        case JobType::Copy:
            return "copy";
        case JobType::Extract:
            return "extract";
        case JobType::Query:
            return "query";
        }
        return "load";
    }

    std::string Job::to_pretty_string() const
    {
        std::ostringstream oss;
        oss << "{\n"
            << "  \"jobReference\": {\"projectId\": \"" << reference.project_id
            << "\", \"jobId\": \"" << reference.job_id << "\"},\n"
            << "  \"type\": \"" << to_string(type) << "\",\n"
            << "  \"status\": {\n"
            << "    \"state\": \"" << state << "\"";
        if (error_result)
        {
            oss << ",\n    \"errorResult\": {\"reason\": \"" << error_result->reason
                << "\", \"message\": \"" << error_result->message << "\"}";
        }
        if (!errors.empty())
        {
            oss << ",\n    \"errors\": [";
            for (size_t i = 0; i < errors.size(); ++i)
            {
                if (i > 0)
                    oss << ", ";
                oss << "{\"reason\": \"" << errors[i].reason
                    << "\", \"message\": \"" << errors[i].message << "\"}";
            }
            oss << "]";
        }
        oss << "\n  },\n"
            << "  \"statistics\": {\"totalBytesProcessed\": " << statistics.total_bytes_processed
            << ", \"outputRows\": " << statistics.output_rows << "}\n"
            << "}";
        return oss.str();
    }

} // namespace BulkBridge
