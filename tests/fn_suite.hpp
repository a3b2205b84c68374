#pragma once

#include <suitegrader/api/suite.hpp>
#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_result.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>

/// A suite whose ``run()`` is supplied by the test
class FnSuite : public suitegrader::Suite
{
public:
    using Body = std::function<suitegrader::SuiteResult(FnSuite&)>;

    FnSuite(std::filesystem::path work_path, int submission_id, suitegrader::SuiteConfig config,
            suitegrader::LoggerPtr logger, Body body)
        : Suite{std::move(work_path), submission_id, std::move(config), std::move(logger)}
        , body_{std::move(body)} {}

    suitegrader::SuiteResult run() override { return body_(*this); }

    using Suite::make_result;

    static suitegrader::SuiteFactory factory(Body body) {
        return [body = std::move(body)](const std::filesystem::path& work_path, int submission_id,
                                        const suitegrader::SuiteConfig& config,
                                        suitegrader::LoggerPtr logger) -> std::unique_ptr<suitegrader::Suite> {
            return std::make_unique<FnSuite>(work_path, submission_id, config, std::move(logger), body);
        };
    }

private:
    Body body_;
};

inline suitegrader::SuiteConfig make_suite_config(std::string name, double max_score = 10, int timeout_sec = 5) {
    suitegrader::SuiteConfig config;
    config.name = std::move(name);
    config.implementation_class = "FnSuite";
    config.max_score = max_score;
    config.timeout_sec = timeout_sec;
    return config;
}
