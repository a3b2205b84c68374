#include <suitegrader/registrars/global_registrar.hpp>

#include <suitegrader/logging.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace suitegrader {

GlobalRegistrar& GlobalRegistrar::get() noexcept {
    // thread-safe singleton initialization pattern
    static GlobalRegistrar local_instance{};

    return local_instance;
}

void GlobalRegistrar::add_suite(std::string class_name, int api_version, SuiteFactory factory) {
    if (find(current_origin_, class_name)) {
        LOG_WARN("Suite class '{}' registered more than once (origin: '{}'); keeping the first registration",
                 class_name, current_origin_);
        return;
    }

    LOG_DEBUG("Registered suite class '{}' (origin: '{}', api version {})", class_name, current_origin_, api_version);

    registrations_.push_back(std::make_unique<SuiteRegistration>(SuiteRegistration{.class_name = std::move(class_name),
                                                                                   .origin = current_origin_,
                                                                                   .api_version = api_version,
                                                                                   .factory = std::move(factory)}));
}

std::optional<std::reference_wrapper<const SuiteRegistration>> GlobalRegistrar::find(std::string_view origin,
                                                                                     std::string_view class_name) const {
    auto matcher = [origin, class_name](const std::unique_ptr<SuiteRegistration>& registration) {
        return registration->origin == origin && registration->class_name == class_name;
    };

    if (auto iter = ranges::find_if(registrations_, matcher); iter != registrations_.end()) {
        return std::cref(**iter);
    }

    return std::nullopt;
}

std::vector<std::string_view> GlobalRegistrar::get_class_names(std::string_view origin) const {
    std::vector<std::string_view> names;

    for (const auto& registration : registrations_) {
        if (registration->origin == origin) {
            names.emplace_back(registration->class_name);
        }
    }

    return names;
}

std::size_t GlobalRegistrar::get_num_registered() const {
    return registrations_.size();
}

GlobalRegistrar::OriginScope::OriginScope(std::string origin)
    : previous_{std::exchange(GlobalRegistrar::get().current_origin_, std::move(origin))} {}

GlobalRegistrar::OriginScope::~OriginScope() {
    GlobalRegistrar::get().current_origin_ = std::move(previous_);
}

} // namespace suitegrader
