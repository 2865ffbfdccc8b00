#pragma once

#include <string>
#include <cstdint>
#include "TableReference.hpp"
#include "TableSchema.hpp"

namespace BulkBridge
{

    // Table metadata as reported by TableClient::get_table()
    struct Table
    {
        TableReference reference;
        TableSchema schema;
        std::string description;
        int64_t num_bytes = 0;
        int64_t num_rows = 0;
        std::string location; // inherited from the enclosing dataset
    };

    struct Dataset
    {
        std::string project_id;
        std::string dataset_id;
        std::string location;
        std::string description;
    };

} // namespace BulkBridge
