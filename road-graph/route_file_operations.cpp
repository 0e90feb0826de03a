#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "route_errors.hpp"
#include "route_file_operations.hpp"

using namespace std;

static string trim(const string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

static Weight parse_distance(const string& field, int line_number) {
    double value = 0.0;
    size_t consumed = 0;
    try {
        value = stod(field, &consumed);
    } catch (const invalid_argument&) {
        throw MalformedLine(line_number, "distance is not a number: '" + field + "'");
    } catch (const out_of_range&) {
        // underflow is a distance far below a tenth, which encodes as 0
        char* end = nullptr;
        double tiny = strtod(field.c_str(), &end);
        if (fabs(tiny) >= 1.0) {
            throw MalformedLine(line_number, "distance out of range: '" + field + "'");
        }
        value = 0.0;
        consumed = static_cast<size_t>(end - field.c_str());
    }
    if (consumed != field.size()) {
        throw MalformedLine(line_number, "trailing characters after distance: '" + field + "'");
    }
    try {
        return encode_weight(value);
    } catch (const InvalidWeight& e) {
        throw InvalidWeight("line " + to_string(line_number) + ": " + e.what());
    }
}

RoadGraph read_routes(istream& in) {
    RoadGraph graph;
    string raw;
    int line_number = 0;
    while (getline(in, raw)) {
        ++line_number;
        string line = trim(raw);
        if (line.empty()) continue;

        size_t first = line.find_first_not_of('(');
        size_t last = line.find_last_not_of(')');
        if (first == string::npos || last < first) {
            throw MalformedLine(line_number, "expected (from, to, distance)");
        }
        line = line.substr(first, last - first + 1);

        vector<string> fields;
        stringstream ss(line);
        string field;
        while (getline(ss, field, ',')) {
            fields.push_back(trim(field));
        }
        if (!line.empty() && line.back() == ',') fields.push_back("");

        if (fields.size() != 3) {
            throw MalformedLine(line_number, "expected 3 comma-separated fields, got " + to_string(fields.size()));
        }
        if (fields[0].empty() || fields[1].empty()) {
            throw MalformedLine(line_number, "location labels cannot be empty");
        }
        graph.add_edge(fields[0], fields[1], parse_distance(fields[2], line_number));
    }
    return graph;
}

RoadGraph read_routes_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    return read_routes(infile);
}

HeuristicTable read_heuristic(istream& in) {
    HeuristicTable table;
    string raw;
    int line_number = 0;
    while (getline(in, raw)) {
        ++line_number;
        string line = trim(raw);
        if (line.empty()) continue;

        istringstream ss(line);
        vector<string> fields;
        string field;
        while (ss >> field) fields.push_back(field);
        if (fields.size() != 3) {
            throw MalformedLine(line_number, "expected 'from goal distance', got " + to_string(fields.size()) + " fields");
        }

        Weight estimate = parse_distance(fields[2], line_number);
        try {
            table.set(fields[0], fields[1], estimate);
        } catch (const InvalidWeight& e) {
            throw InvalidWeight("line " + to_string(line_number) + ": " + e.what());
        }
    }
    return table;
}

HeuristicTable read_heuristic_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    return read_heuristic(infile);
}

void write_routes_to_file(const RoadGraph& graph, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    for (NodeId u = 0; u < graph.node_count(); ++u) {
        for (const auto& link : graph.links(u)) {
            // each road is written from its lower-indexed endpoint
            if (link.to < u) continue;
            outfile << "(" << graph.label(u) << ", " << graph.label(link.to) << ", "
                    << format_weight(link.weight) << ")\n";
        }
    }
}

void write_heuristic_to_file(const HeuristicTable& table, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    for (const auto& entry : table.entries()) {
        outfile << entry.from << " " << entry.goal << " " << format_weight(entry.estimate) << "\n";
    }
}
