// predicate.cpp - Predicates and algorithm names

#include <docdiff/predicate.h>
#include <docdiff/diff_config.h>

#include <stdexcept>

namespace docdiff {

Predicate::Predicate(std::string name, function_type fn)
    : name_(std::move(name)), fn_(std::move(fn))
{
    if (!fn_) {
        throw std::invalid_argument("Predicate '" + name_ + "' has no function");
    }
}

Predicate Predicate::equality()
{
    return Predicate{};
}

std::string_view to_string(SequenceAlgorithm algorithm) noexcept
{
    switch (algorithm) {
        case SequenceAlgorithm::Exhaustive:      return "exhaustive";
        case SequenceAlgorithm::ClassicLcs:      return "classic-lcs";
        case SequenceAlgorithm::LibraryAssisted: return "library-assisted";
    }
    return "unknown";
}

SequenceAlgorithm parse_sequence_algorithm(std::string_view name)
{
    if (name == "exhaustive" || name == "bruteforce") {
        return SequenceAlgorithm::Exhaustive;
    }
    if (name == "classic-lcs" || name == "myers") {
        return SequenceAlgorithm::ClassicLcs;
    }
    if (name == "library-assisted" || name == "difflib") {
        return SequenceAlgorithm::LibraryAssisted;
    }
    throw std::invalid_argument("Unknown sequence algorithm: " + std::string(name));
}

} // namespace docdiff
