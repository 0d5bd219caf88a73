#pragma once

/// @file sjson.hpp
/// @author Aleksandr Loshkarev
/// @brief Main header file for the sjson streaming parser.
///
/// @code
///   auto p = sjson::root().bind([](sjson::ParseResult<sjson::Root> r) {
///       return sjson::decode_value_or_fail<std::vector<int>>(r);
///   });
///   auto out = sjson::parse_all(p, "[1, 2, 3]");
///   // out.value().second == {1, 2, 3}
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "value.hpp"
#include "parse_options.hpp"
#include "engine.hpp"
#include "path.hpp"
#include "result.hpp"
#include "conversion.hpp"
#include "traversal.hpp"
#include "navigation.hpp"
#include "path_parser.hpp"
#include "stream.hpp"
