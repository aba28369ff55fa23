#include "edit_generator.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "config/sections/fuzzy_config.hpp"
#include "logging/log_config.hpp"

namespace lexitrie::fuzzy {

namespace {

auto logger() -> std::shared_ptr<spdlog::logger> {
    return logging::LogConfig::getLogger("lexitrie.fuzzy");
}

void validateDistance(int distance) {
    if (distance <= 0) {
        THROW_INVALID_ARGUMENT("Edit distance must be positive, got " +
                               std::to_string(distance));
    }
}

}  // namespace

auto edits1(std::string_view word, std::string_view alphabet) -> EditSet {
    EditSet result;
    auto const length = word.size();
    result.reserve(length * (2 * alphabet.size() + 2) + alphabet.size());

    for (size_t i = 0; i <= length; ++i) {
        auto const left = word.substr(0, i);
        auto const right = word.substr(i);

        for (char symbol : alphabet) {
            std::string inserted;
            inserted.reserve(length + 1);
            inserted.append(left).push_back(symbol);
            inserted.append(right);
            result.insert(std::move(inserted));
        }

        if (right.empty()) {
            continue;
        }

        std::string deleted(left);
        deleted.append(right.substr(1));
        result.insert(std::move(deleted));

        if (right.size() > 1) {
            std::string swapped(left);
            swapped.push_back(right[1]);
            swapped.push_back(right[0]);
            swapped.append(right.substr(2));
            result.insert(std::move(swapped));
        }

        for (char symbol : alphabet) {
            std::string replaced(word);
            replaced[i] = symbol;
            result.insert(std::move(replaced));
        }
    }

    return result;
}

auto editsN(std::string_view word, int distance, std::string_view alphabet)
    -> EditSet {
    validateDistance(distance);

    EditSet frontier = edits1(word, alphabet);
    for (int step = 1; step < distance; ++step) {
        EditSet next;
        for (const auto& candidate : frontier) {
            next.merge(edits1(candidate, alphabet));
        }
        frontier = std::move(next);
    }

    logger()->debug("Generated {} candidates at distance {} from '{}'",
                    frontier.size(), distance, word);
    return frontier;
}

EditGenerator::EditGenerator(std::string alphabet)
    : alphabet_(std::move(alphabet)) {
    if (alphabet_.empty()) {
        THROW_INVALID_ARGUMENT("Edit alphabet cannot be empty");
    }
}

EditGenerator::EditGenerator(const config::FuzzyConfig& config)
    : EditGenerator(config.alphabet) {
    validateDistance(config.defaultDistance);
    defaultDistance_ = config.defaultDistance;
}

auto EditGenerator::single(std::string_view word) const -> EditSet {
    return edits1(word, alphabet_);
}

auto EditGenerator::generate(std::string_view word, int distance) const
    -> EditSet {
    return editsN(word, distance, alphabet_);
}

}  // namespace lexitrie::fuzzy
