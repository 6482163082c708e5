//! # Strata JSON Library
//!
//! Umbrella header for the JSON value model, parser and serializer used for
//! `strata.json` configuration files and machine-readable reports.

#pragma once

#include "strata/json/json_error.hpp"
#include "strata/json/json_parser.hpp"
#include "strata/json/json_value.hpp"
