#pragma once

#include "duckdb.hpp"
#include "duckdb/common/case_insensitive_map.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/value.hpp"
#include "duckdb/common/vector.hpp"
#include "duckdb/common/serializer/read_stream.hpp"
#include "duckdb/common/serializer/write_stream.hpp"

#include <cstring>

namespace ewkb {

// Use the same types and helpers as DuckDB
using duckdb::idx_t;
using duckdb::data_t;
using duckdb::data_ptr_t;
using duckdb::const_data_ptr_t;
using duckdb::const_data_ptr_cast;
using duckdb::data_ptr_cast;

using duckdb::string;
using duckdb::vector;
using duckdb::unique_ptr;
using duckdb::make_uniq;
using duckdb::make_uniq_array;
using duckdb::case_insensitive_map_t;

using duckdb::Load;
using duckdb::Store;
using duckdb::MinValue;
using duckdb::MaxValue;

using duckdb::Value;
using duckdb::StringValue;
using duckdb::LogicalType;
using duckdb::LogicalTypeId;
using duckdb::StringUtil;
using duckdb::Printer;

using duckdb::ReadStream;
using duckdb::WriteStream;

using duckdb::Exception;
using duckdb::InvalidInputException;
using duckdb::InternalException;
using duckdb::SerializationException;
using duckdb::NotImplementedException;

} // namespace ewkb
