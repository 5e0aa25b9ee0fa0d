/// @file splice_ot.hpp
/// @brief Umbrella header for the splice-ot library.
///
/// Include this single header for access to all public types:
/// Operation, Patch, ContentHash, Config, the policy types, the packed
/// wire format and the random generators.

#pragma once

#include <splice-ot/config.hpp>
#include <splice-ot/content_hash.hpp>
#include <splice-ot/error.hpp>
#include <splice-ot/json.hpp>
#include <splice-ot/operation.hpp>
#include <splice-ot/patch.hpp>
#include <splice-ot/policy.hpp>
#include <splice-ot/random.hpp>
