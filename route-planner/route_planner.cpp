#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <string>

#include "route_errors.hpp"
#include "route_planner.hpp"

using namespace std;

static const int LOCATIONS_PER_ROW = 5;
static const int LOCATION_COLUMN_WIDTH = 15;

static bool is_quit(const string &answer) {
    string lower = answer;
    transform(lower.begin(), lower.end(), lower.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return lower == "quit";
}

RoutePlanner::RoutePlanner(const RoadGraph &graph, const HeuristicTable &heuristic,
                           istream &in, ostream &out, bool clear_screen)
    : graph_(graph), heuristic_(heuristic), in_(in), out_(out), clear_screen_(clear_screen) {}

void RoutePlanner::clear_screen() {
    if (clear_screen_) out_ << "\033[2J\033[H";
}

// Returns false at end of input.
bool RoutePlanner::read_answer(string &answer) {
    out_ << "  >> " << flush;
    if (!getline(in_, answer)) return false;
    size_t first = answer.find_first_not_of(" \t\r");
    size_t last = answer.find_last_not_of(" \t\r");
    answer = first == string::npos ? "" : answer.substr(first, last - first + 1);
    return true;
}

void RoutePlanner::wait_for_enter() {
    out_ << "Press ENTER to continue..." << flush;
    string ignored;
    getline(in_, ignored);
}

void RoutePlanner::list_locations() {
    out_ << "Your Locations:\n\n";
    const auto &labels = graph_.nodes();
    for (size_t i = 0; i < labels.size(); ++i) {
        out_ << left << setw(LOCATION_COLUMN_WIDTH) << labels[i];
        if (i % LOCATIONS_PER_ROW == LOCATIONS_PER_ROW - 1) out_ << '\n';
    }
    if (labels.size() % LOCATIONS_PER_ROW != 0) out_ << '\n';
    out_ << right;
}

void RoutePlanner::run() {
    while (true) {
        clear_screen();
        list_locations();

        out_ << "--\nWhat city are you starting at?\n";
        out_ << "Type \"Quit\" at any time to exit.\n";
        string from;
        if (!read_answer(from) || is_quit(from)) break;

        out_ << "What city are you going to?\n";
        string to;
        if (!read_answer(to) || is_quit(to)) break;

        clear_screen();
        compare_routes(from, to);
        wait_for_enter();
        if (!in_) break;
    }
}

bool RoutePlanner::compare_routes(const string &from, const string &to) {
    if (!graph_.contains_node(from) || !graph_.contains_node(to)) {
        out_ << "Cannot route: one or more locations do not exist.\n";
        return false;
    }

    long long a_star_micros = 0;
    long long dijkstra_micros = 0;
    out_ << "\nRunning A* Algorithm...\n";
    bool a_star_found = run_search(&heuristic_, from, to, a_star_micros);
    out_ << "\nRunning Dijkstra Algorithm...\n";
    bool dijkstra_found = run_search(nullptr, from, to, dijkstra_micros);

    out_ << "--\n";
    if (a_star_found) out_ << "A* time to compute: " << a_star_micros << " micros.\n";
    if (dijkstra_found) out_ << "Dijkstra time to compute: " << dijkstra_micros << " micros.\n";
    out_ << '\n';
    return a_star_found && dijkstra_found;
}

bool RoutePlanner::run_search(const HeuristicTable *heuristic, const string &from,
                              const string &to, long long &micros) {
    try {
        auto t0 = chrono::steady_clock::now();
        RouteResult route = search_route(graph_, heuristic, from, to);
        auto t1 = chrono::steady_clock::now();
        micros = chrono::duration_cast<chrono::microseconds>(t1 - t0).count();
        print_route(route);
        return true;
    } catch (const UnknownNode &e) {
        out_ << e.what() << '\n';
    } catch (const MissingHeuristic &e) {
        out_ << e.what() << '\n';
    } catch (const UnreachableRoute &e) {
        out_ << e.what() << '\n';
    } catch (const InvalidWeight &e) {
        out_ << e.what() << '\n';
    }
    return false;
}

void RoutePlanner::print_route(const RouteResult &route) {
    out_ << route.expanded << " nodes considered\n";
    for (size_t i = 0; i + 1 < route.path.size(); ++i) {
        const string &u = route.path[i];
        const string &v = route.path[i + 1];
        auto weight = graph_.edge_weight(u, v);
        out_ << "Take " << u << " to " << v << ": " << format_weight(weight.value_or(0)) << " mi.\n";
    }
    out_ << "Total distance: " << format_weight(route.distance) << " mi.\n";
}
