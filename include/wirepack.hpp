#pragma once

/**
 * @file wirepack.hpp
 * @brief Declarative binary marshalling
 *
 * Types provided:
 * - Schema / SchemaBuilder - per-record field table (layouts, guards, constraints)
 * - pack / unpack / packed_size - schema-driven codec
 * - SecurityLimits - bounds applied to untrusted input on unpack
 * - internet_checksum / checksum / with_checksum - RFC 1071 checksum
 *
 * Ready-made protocol headers live in wirepack/packets.hpp.
 */

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/condition.hpp"
#include "wirepack/constraint.hpp"
#include "wirepack/error.hpp"
#include "wirepack/expected.hpp"
#include "wirepack/layout.hpp"
#include "wirepack/schema.hpp"
#include "wirepack/security_limits.hpp"
#include "wirepack/types.hpp"
