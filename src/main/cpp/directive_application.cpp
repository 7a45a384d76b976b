#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/result.hpp"
#include "lamp/util/severity.hpp"
#include "lamp/util/source_position.hpp"
#include "lamp/util/typo.hpp"

#include "lamp/diagnostic.hpp"
#include "lamp/directive.hpp"
#include "lamp/directive_application.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/services.hpp"
#include "lamp/settings.hpp"

namespace lamp {

std::pmr::u8string lookup_failure_message(
    std::u8string_view label,
    std::u8string_view name,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string result { u8"No ", memory };
    result += label;
    result += u8" directive registered with name: ";
    result += name;
    return result;
}

std::pmr::u8string invalid_directive_message(
    std::u8string_view name,
    std::span<const std::pmr::u8string> messages,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string result { u8"One or more errors processing directive '", memory };
    result += name;
    result += u8"': ";
    for (std::size_t i = 0; i < messages.size(); ++i) {
        if (i != 0) {
            result += u8", ";
        }
        result += messages[i];
    }
    return result;
}

Result<Part_Map, Messages>
make_part_map(std::span<const Part> parts, std::pmr::memory_resource* memory)
{
    Part_Map result { memory };
    std::pmr::vector<const Part_Key*> duplicates { memory };

    for (const Part& part : parts) {
        const auto [it, inserted] = result.try_emplace(part.key, part.content);
        if (inserted) {
            continue;
        }
        const bool already_reported = std::ranges::any_of(duplicates, [&](const Part_Key* key) {
            return *key == part.key;
        });
        if (!already_reported) {
            duplicates.push_back(&part.key);
        }
    }

    if (duplicates.empty()) {
        return result;
    }

    // Duplicates are reported in the order in which the duplicated keys first occur,
    // not in the order in which their repetitions occur.
    Messages messages { memory };
    for (const Part& part : parts) {
        const auto it = std::ranges::find_if(duplicates, [&](const Part_Key* key) {
            return key && *key == part.key;
        });
        if (it == duplicates.end()) {
            continue;
        }
        std::pmr::u8string message { u8"Duplicate ", memory };
        message += describe(part.key, memory);
        messages.push_back(std::move(message));
        *it = nullptr;
    }
    return messages;
}

namespace detail {

void log_lookup_failure(
    std::u8string_view message,
    std::u8string_view name,
    Names_Provider registered_names,
    const Source_Span& location,
    const Parse_Options& options
)
{
    log_directive_error(diagnostic::directive_lookup, message, location, options);
    if (!options.logger.can_log(Severity::info)) {
        return;
    }

    const std::pmr::vector<std::u8string_view> names = registered_names();
    const Distant<std::size_t> match = closest_match(names, name, options.memory);
    if (!match || match.distance > max_typo_suggestion_distance) {
        return;
    }
    std::pmr::u8string suggestion { u8"Did you mean '", options.memory };
    suggestion += names[match.value];
    suggestion += u8"'?";
    options.logger.log(
        Diagnostic {
            .severity = Severity::info,
            .id = diagnostic::directive_lookup_suggestion,
            .file = options.file_name,
            .location = location,
            .message = suggestion,
        }
    );
}

void log_directive_error(
    std::u8string_view id,
    std::u8string_view message,
    const Source_Span& location,
    const Parse_Options& options
)
{
    options.logger.log(
        Diagnostic {
            .severity = Severity::error,
            .id = id,
            .file = options.file_name,
            .location = location,
            .message = message,
        }
    );
}

} // namespace detail

} // namespace lamp
