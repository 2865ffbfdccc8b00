#include "TableReference.hpp"
#include "../common/Errors.hpp"
#include <ctre.hpp>

namespace BulkBridge
{

    // =========================================================================
    // TABLE SPEC GRAMMAR
    // =========================================================================
    //   project : [a-z][-a-z0-9:.]{4,61}[a-z0-9]   (6-63 chars, starts with a letter)
    //   dataset : [-\w.]{1,1024}
    //   table   : [-\w$@]{1,1024}
    //
    //   spec    : (project ':')? dataset '.' table
    //
    // The project grammar is looser than what the warehouse accepts. It only
    // has to be exact enough to split the three parts apart.
    //
    // Capture groups: 2 = project, 3 = dataset, 4 = table
    // =========================================================================
    static constexpr auto TABLE_SPEC_PATTERN = ctll::fixed_string{
        R"((([a-z][-a-z0-9:.]{4,61}[a-z0-9]):)?([-\w.]{1,1024})\.([-\w$@]{1,1024}))"};

    TableReference TableReference::with_default_project(const std::string &project) const
    {
        TableReference ref = *this;
        if (ref.project_id.empty())
            ref.project_id = project;
        return ref;
    }

    TableReference parse_table_spec(std::string_view table_spec)
    {
        auto m = ctre::match<TABLE_SPEC_PATTERN>(table_spec);
        if (!m)
        {
            throw ConfigurationError(
                "Table reference is not in [project_id]:[dataset_id].[table_id] format: " +
                std::string(table_spec));
        }

        TableReference ref;
        if (m.get<2>())
            ref.project_id = m.get<2>().to_string();
        ref.dataset_id = m.get<3>().to_string();
        ref.table_id = m.get<4>().to_string();
        return ref;
    }

    std::string to_table_spec(const TableReference &ref)
    {
        std::string spec;
        spec.reserve(ref.project_id.size() + ref.dataset_id.size() + ref.table_id.size() + 2);
        if (!ref.project_id.empty())
        {
            spec += ref.project_id;
            spec += ':';
        }
        spec += ref.dataset_id;
        spec += '.';
        spec += ref.table_id;
        return spec;
    }

    bool is_valid_table_spec(std::string_view table_spec)
    {
        return static_cast<bool>(ctre::match<TABLE_SPEC_PATTERN>(table_spec));
    }

} // namespace BulkBridge
