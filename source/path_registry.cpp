// path_registry.cpp - Per-path predicate and differ lookup

#include <docdiff/path_registry.h>
#include <docdiff/string_path.h>
#include <docdiff/structural_diff.h>

#include <stdexcept>

namespace docdiff {

namespace {

const PredicateList& default_predicates()
{
    static const PredicateList predicates{Predicate::equality()};
    return predicates;
}

const Differ& default_differ()
{
    static const Differ differ{&diff};
    return differ;
}

bool is_canonical(std::string_view path)
{
    return path.empty() || (path.front() == '/' && path.back() != '/');
}

} // anonymous namespace

PathRegistry::PathRegistry()
    : table_(std::make_shared<const table_type>())
{
}

PathRegistry::PathRegistry(std::shared_ptr<const table_type> table)
    : table_(std::move(table))
{
}

const PathRegistry::Entry* PathRegistry::find(std::string_view path) const
{
    if (table_->empty()) {
        return nullptr;
    }
    auto it = is_canonical(path) ? table_->find(path) : table_->find(normalize_path(path));
    return it == table_->end() ? nullptr : &it->second;
}

const PredicateList& PathRegistry::predicates_at(std::string_view path) const
{
    const Entry* entry = find(path);
    if (entry && !entry->predicates.empty()) {
        return entry->predicates;
    }
    return default_predicates();
}

const Differ& PathRegistry::differ_at(std::string_view path) const
{
    const Entry* entry = find(path);
    if (entry && entry->differ) {
        return entry->differ;
    }
    return default_differ();
}

bool PathRegistry::has_predicates(std::string_view path) const
{
    const Entry* entry = find(path);
    return entry && !entry->predicates.empty();
}

bool PathRegistry::has_differ(std::string_view path) const
{
    const Entry* entry = find(path);
    return entry && static_cast<bool>(entry->differ);
}

const PathRegistry& PathRegistry::defaults()
{
    static const PathRegistry registry;
    return registry;
}

// ============================================================
// PathRegistryBuilder
// ============================================================

PathRegistryBuilder& PathRegistryBuilder::predicates(std::string_view path, PredicateList predicates)
{
    if (predicates.empty()) {
        throw std::invalid_argument("Empty predicate list for path '" + std::string(path) + "'");
    }
    table_[normalize_path(path)].predicates = std::move(predicates);
    return *this;
}

PathRegistryBuilder& PathRegistryBuilder::differ(std::string_view path, Differ differ)
{
    if (!differ) {
        throw std::invalid_argument("Empty differ for path '" + std::string(path) + "'");
    }
    table_[normalize_path(path)].differ = std::move(differ);
    return *this;
}

PathRegistry PathRegistryBuilder::finish()
{
    auto table = std::make_shared<const PathRegistry::table_type>(std::move(table_));
    table_.clear();
    return PathRegistry{std::move(table)};
}

} // namespace docdiff
