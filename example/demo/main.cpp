// main.cpp - Notebook Diff Example
//
// Usage: docdiff_demo [algorithm] [a.json b.json]
//   algorithm: exhaustive | classic-lcs | library-assisted (default classic-lcs)
//   Without files, two built-in notebooks are compared.

#include <docdiff/errors.h>
#include <docdiff/serialization.h>
#include <docdiff/structural_diff.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace docdiff;

// ============================================================
// Sample Documents
// ============================================================

namespace {

const char* sample_before = R"({
    "metadata": {"kernelspec": {"name": "python3"}, "language": "python"},
    "cells": [
        {"id": "c1", "cell_type": "markdown", "source": "# Analysis"},
        {"id": "c2", "cell_type": "code", "source": "data = load()", "outputs": []},
        {"id": "c3", "cell_type": "code", "source": "plot(data)", "outputs": [{"text": "<figure>"}]}
    ]
})";

const char* sample_after = R"({
    "metadata": {"kernelspec": {"name": "python3"}},
    "cells": [
        {"id": "c1", "cell_type": "markdown", "source": "# Data Analysis"},
        {"id": "c4", "cell_type": "code", "source": "import numpy", "outputs": []},
        {"id": "c2", "cell_type": "code", "source": "data = load(cache=True)", "outputs": []},
        {"id": "c3", "cell_type": "code", "source": "plot(data)", "outputs": [{"text": "<figure 2>"}]}
    ]
})";

bool read_document(const std::string& file, Value& out)
{
    std::ifstream in(file);
    if (!in) {
        std::cerr << "cannot open " << file << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::string error;
    out = from_json(buffer.str(), &error);
    if (!error.empty()) {
        std::cerr << file << ": " << error << "\n";
        return false;
    }
    return true;
}

// Cells are matched exactly first, then by id, then by cell type
PathRegistry notebook_registry()
{
    auto same_id = make_predicate("same id", [](const Value& x, const Value& y) {
        return x.contains("id") && x.at("id") == y.at("id");
    });
    auto same_type = make_predicate("same cell type", [](const Value& x, const Value& y) {
        return x.at("cell_type") == y.at("cell_type");
    });

    return PathRegistryBuilder{}
        .predicates("/cells", {Predicate::equality(), same_id, same_type})
        .finish();
}

} // namespace

// ============================================================
// Main Application
// ============================================================

int main(int argc, char* argv[])
{
    DiffConfig config;
    int arg = 1;

    if (argc == 2 || argc == 4) {
        try {
            config.algorithm = parse_sequence_algorithm(argv[arg++]);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return 2;
        }
    }

    Value before;
    Value after;
    if (argc - arg == 2) {
        if (!read_document(argv[arg], before) || !read_document(argv[arg + 1], after)) {
            return 2;
        }
    } else if (argc - arg == 0) {
        before = from_json(sample_before);
        after = from_json(sample_after);
    } else {
        std::cerr << "usage: " << argv[0] << " [algorithm] [a.json b.json]\n";
        return 2;
    }

    std::cout << "=== Notebook Diff (" << to_string(config.algorithm) << ") ===\n\n";

    try {
        // Matching blocks only work with plain equality
        const PathRegistry registry = config.algorithm == SequenceAlgorithm::LibraryAssisted
                                          ? PathRegistry::defaults()
                                          : notebook_registry();
        Diff d = diff(before, after, "", registry, config);

        print_diff(d, std::cout);

        std::cout << "\n=== JSON ===\n" << to_json(to_value(d)) << "\n";
    } catch (const diff_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
