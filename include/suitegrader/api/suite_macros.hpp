#pragma once

#include <suitegrader/api/suite.hpp>                // IWYU pragma: export
#include <suitegrader/api/suite_config.hpp>         // IWYU pragma: export
#include <suitegrader/api/suite_result.hpp>         // IWYU pragma: export
#include <suitegrader/logging.hpp>                  // IWYU pragma: export
#include <suitegrader/registrars/auto_registrars.hpp> // IWYU pragma: export

#include <boost/preprocessor/cat.hpp>

/// Bumped whenever ``Suite``, ``SuiteConfig`` or ``SuiteResult`` change layout.
/// A plugin compiled against a different version is refused at load time.
#define SUITEGRADER_PLUGIN_API_VERSION 1

/// Register a ``Suite`` subclass so that configurations can name it in their ``class`` key.
///
/// Usage:
///
/// class MySuite : public suitegrader::Suite {
/// public:
///     using Suite::Suite;
///     suitegrader::SuiteResult run() override;
/// };
/// SUITEGRADER_SUITE(MySuite);
#define SUITEGRADER_SUITE(class_name)                                                                                  \
    namespace {                                                                                                        \
    const ::suitegrader::SuiteAutoRegistrar<class_name> BOOST_PP_CAT(suitegrader_registrar__, __COUNTER__){            \
        #class_name, SUITEGRADER_PLUGIN_API_VERSION};                                                                  \
    }                                                                                                                  \
    static_assert(true, "require a trailing semicolon")
