/// \file
/// Everything a suite plugin needs
#pragma once

#include <suitegrader/api/suite.hpp>         // IWYU pragma: export
#include <suitegrader/api/suite_config.hpp>  // IWYU pragma: export
#include <suitegrader/api/suite_macros.hpp>  // IWYU pragma: export
#include <suitegrader/api/suite_result.hpp>  // IWYU pragma: export
#include <suitegrader/logging.hpp>           // IWYU pragma: export
#include <suitegrader/version.hpp>           // IWYU pragma: export
