#include "util/read_constraints.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "constraints/constraints.hpp"
#include "constraints/errors.hpp"

namespace pconstraints {

namespace {

std::optional<int> parse_bound(const std::string& token) {
    if (token == "inf") {
        return infinity;
    }
    std::istringstream iss(token);
    int value;
    if (!(iss >> value) || !iss.eof()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<std::vector<packed_constraints>> read_constraints_istream(std::istream& fin) {
    std::string line;
    std::getline(fin, line);
    if (line.rfind("%%", 0) != 0) {
        std::cerr << "Error: missing header";
        return std::nullopt;
    }

    // Ignore comments:
    while (fin.peek() == '%') {
        fin.ignore(2048, '\n');
    }

    long long count;
    if (!(fin >> count)) {
        std::cerr << "Error: missing number of constraints";
        return std::nullopt;
    }
    if (count < 0) {
        std::cerr << "Error: negative number of constraints " << count;
        return std::nullopt;
    }
    auto n = static_cast<size_t>(count);
    std::getline(fin, line);

    auto result = std::vector<packed_constraints>();
    // the count is not trusted for the allocation
    result.reserve(std::min<size_t>(n, 1 << 20));
    while (std::getline(fin, line)) {
        if (line.empty()) {
            continue;
        }
        std::istringstream iss(line);
        std::string tokens[4];
        if (!(iss >> tokens[0] >> tokens[1] >> tokens[2] >> tokens[3])) {
            return std::nullopt;
        }
        int values[4];
        for (int i = 0; i < 4; i++) {
            auto value = parse_bound(tokens[i]);
            if (!value) {
                std::cerr << "Error: invalid bound " << tokens[i];
                return std::nullopt;
            }
            values[i] = value.value();
        }
        try {
            result.push_back(make(values[0], values[1], values[2], values[3]));
        } catch (const constraints_error& e) {
            std::cerr << "Error: " << e.what();
            return std::nullopt;
        }
    }

    if (result.size() != n) {
        std::cerr << "Error: expected " << n << " constraints, read " << result.size();
        return std::nullopt;
    }
    return result;
}

std::optional<std::vector<packed_constraints>> read_constraints(std::string file) {
    std::ifstream fin(file);
    if (fin.fail()) {
        std::cerr << "Error: could not open " << file;
        return std::nullopt;
    }
    auto result = read_constraints_istream(fin);
    fin.close();
    return result;
}

void write_bounds(std::ostream& out, const pconstraints::bounds& b) {
    auto bound = [](int value) {
        return value == infinity ? std::string("inf") : std::to_string(value);
    };
    out << b.min_width << " " << bound(b.max_width) << " " << b.min_height << " "
        << bound(b.max_height);
}

} // namespace pconstraints
