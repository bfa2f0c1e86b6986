#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "command/reply.hpp"
#include "storage/geo.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace tkv::command {

namespace {

namespace geo = storage::geo;
using storage::Database;
using storage::Kind;

RespValue unsupported_unit() {
    return error("ERR unsupported unit provided. please use M, KM, FT, MI");
}

RespValue coordinates_reply(const geo::Coordinates& c) {
    return RespValue::array({RespValue::bulk(fmt::format("{:.17g}", c.longitude)),
                             RespValue::bulk(fmt::format("{:.17g}", c.latitude))});
}

// Stored position of `member`. nullopt if the key or member is absent, or if
// the score is not a geohash (a member added with ZADD).
std::error_code member_position(Context& ctx, std::string_view key, std::string_view member,
                                std::optional<geo::Coordinates>& out) {
    out.reset();
    std::optional<double> score;
    if (auto ec = ctx.db.zscore(key, member, score)) return ec;
    if (score) out = geo::decode_score(*score);
    return {};
}

// ── GEOADD / GEOPOS / GEODIST ────────────────────────────────────────────────

// GEOADD key longitude latitude member [longitude latitude member ...]
Outcome geoadd(Context& ctx, Args args) {
    if ((args.size() - 2) % 3 != 0) return syntax_error();

    std::vector<Database::ScoredMember> items;
    items.reserve((args.size() - 2) / 3);
    for (std::size_t i = 2; i < args.size(); i += 3) {
        double longitude = 0.0;
        double latitude = 0.0;
        if (!parse_double(args[i], longitude) || !parse_double(args[i + 1], latitude)) {
            return not_float_error();
        }
        if (!geo::valid(longitude, latitude)) {
            return error(fmt::format("ERR invalid longitude,latitude pair {:.6f},{:.6f}",
                                     longitude, latitude));
        }
        items.emplace_back(static_cast<double>(geo::encode(longitude, latitude)), args[i + 2]);
    }

    std::size_t added = 0;
    if (auto ec = ctx.db.zadd(args[1], items, added)) return ctx.fail(ec, args[1], Kind::SortedSet);
    return integer(static_cast<int64_t>(added));
}

Outcome geopos(Context& ctx, Args args) {
    std::vector<RespValue> out;
    out.reserve(args.size() - 2);
    for (std::size_t i = 2; i < args.size(); ++i) {
        std::optional<geo::Coordinates> position;
        if (auto ec = member_position(ctx, args[1], args[i], position)) {
            return ctx.fail(ec, args[1], Kind::SortedSet);
        }
        out.push_back(position ? coordinates_reply(*position) : RespValue::null_array());
    }
    return RespValue::array(std::move(out));
}

// GEODIST key member1 member2 [M|KM|FT|MI]
Outcome geodist(Context& ctx, Args args) {
    if (args.size() > 5) return syntax_error();
    double unit = 1.0;
    if (args.size() == 5) {
        auto meters = geo::unit_to_meters(args[4]);
        if (!meters) return unsupported_unit();
        unit = *meters;
    }

    std::optional<geo::Coordinates> a;
    std::optional<geo::Coordinates> b;
    if (auto ec = member_position(ctx, args[1], args[2], a)) {
        return ctx.fail(ec, args[1], Kind::SortedSet);
    }
    if (auto ec = member_position(ctx, args[1], args[3], b)) {
        return ctx.fail(ec, args[1], Kind::SortedSet);
    }
    if (!a || !b) return RespValue::null_bulk();
    return RespValue::bulk(fmt::format("{:.4f}", geo::distance(*a, *b) / unit));
}

// ── GEOSEARCH ────────────────────────────────────────────────────────────────

struct SearchOptions {
    std::optional<std::string_view> from_member;
    std::optional<geo::Coordinates> from_lonlat;

    std::optional<double> radius_m;
    std::optional<std::pair<double, double>> box_m;  // width, height
    double unit = 1.0;

    enum class Order { None, Asc, Desc } order = Order::None;
    std::optional<std::size_t> count;
    bool any = false;

    bool with_coord = false;
    bool with_dist = false;
    bool with_hash = false;
};

// Parses everything after the key. Returns an error reply on failure.
std::optional<RespValue> parse_search(Args args, SearchOptions& opts) {
    for (std::size_t i = 2; i < args.size(); ++i) {
        const auto arg = args[i];
        const std::size_t left = args.size() - i - 1;

        if (iequals(arg, "frommember") && left >= 1) {
            if (opts.from_member || opts.from_lonlat) return syntax_error();
            opts.from_member = args[++i];
        } else if (iequals(arg, "fromlonlat") && left >= 2) {
            if (opts.from_member || opts.from_lonlat) return syntax_error();
            double longitude = 0.0;
            double latitude = 0.0;
            if (!parse_double(args[i + 1], longitude) || !parse_double(args[i + 2], latitude)) {
                return not_float_error();
            }
            if (!geo::valid(longitude, latitude)) {
                return error(fmt::format("ERR invalid longitude,latitude pair {:.6f},{:.6f}",
                                         longitude, latitude));
            }
            opts.from_lonlat = geo::Coordinates{longitude, latitude};
            i += 2;
        } else if (iequals(arg, "byradius") && left >= 2) {
            if (opts.radius_m || opts.box_m) return syntax_error();
            double radius = 0.0;
            if (!parse_double(args[i + 1], radius)) return not_float_error();
            if (radius < 0) return error("ERR radius cannot be negative");
            auto unit = geo::unit_to_meters(args[i + 2]);
            if (!unit) return unsupported_unit();
            opts.unit = *unit;
            opts.radius_m = radius * *unit;
            i += 2;
        } else if (iequals(arg, "bybox") && left >= 3) {
            if (opts.radius_m || opts.box_m) return syntax_error();
            double width = 0.0;
            double height = 0.0;
            if (!parse_double(args[i + 1], width) || !parse_double(args[i + 2], height)) {
                return not_float_error();
            }
            if (width < 0 || height < 0) return error("ERR height or width cannot be negative");
            auto unit = geo::unit_to_meters(args[i + 3]);
            if (!unit) return unsupported_unit();
            opts.unit = *unit;
            opts.box_m = std::make_pair(width * *unit, height * *unit);
            i += 3;
        } else if (iequals(arg, "asc")) {
            opts.order = SearchOptions::Order::Asc;
        } else if (iequals(arg, "desc")) {
            opts.order = SearchOptions::Order::Desc;
        } else if (iequals(arg, "count") && left >= 1) {
            int64_t n = 0;
            if (!parse_int(args[++i], n)) return not_integer_error();
            if (n <= 0) return error("ERR COUNT must be > 0");
            opts.count = static_cast<std::size_t>(n);
            if (i + 1 < args.size() && iequals(args[i + 1], "any")) {
                opts.any = true;
                ++i;
            }
        } else if (iequals(arg, "any")) {
            return error("ERR the ANY argument requires COUNT argument");
        } else if (iequals(arg, "withcoord")) {
            opts.with_coord = true;
        } else if (iequals(arg, "withdist")) {
            opts.with_dist = true;
        } else if (iequals(arg, "withhash")) {
            opts.with_hash = true;
        } else {
            return syntax_error();
        }
    }

    if (!opts.from_member && !opts.from_lonlat) {
        return error("ERR exactly one of FROMMEMBER or FROMLONLAT can be specified for GEOSEARCH");
    }
    if (!opts.radius_m && !opts.box_m) {
        return error("ERR exactly one of BYRADIUS and BYBOX can be specified for GEOSEARCH");
    }
    return std::nullopt;
}

struct Match {
    std::string member;
    double distance_m = 0.0;
    uint64_t hash = 0;
    geo::Coordinates position;
};

// GEOSEARCH key FROMMEMBER member | FROMLONLAT lon lat
//           BYRADIUS radius unit | BYBOX width height unit
//           [ASC|DESC] [COUNT n [ANY]] [WITHCOORD] [WITHDIST] [WITHHASH]
Outcome geosearch(Context& ctx, Args args) {
    SearchOptions opts;
    if (auto failure = parse_search(args, opts)) return std::move(*failure);

    const auto key = args[1];
    std::vector<storage::SortedSet::Item> items;
    if (auto ec = ctx.db.zrange(key, 0, -1, items)) return ctx.fail(ec, key, Kind::SortedSet);
    if (items.empty()) return RespValue::array();

    geo::Coordinates centre;
    if (opts.from_member) {
        std::optional<geo::Coordinates> position;
        if (auto ec = member_position(ctx, key, *opts.from_member, position)) {
            return ctx.fail(ec, key, Kind::SortedSet);
        }
        if (!position) return error_reply(storage::errc::no_such_member);
        centre = *position;
    } else {
        centre = *opts.from_lonlat;
    }

    std::vector<Match> matches;
    for (auto& [score, member] : items) {
        const auto decoded = geo::decode_score(score);
        if (!decoded) continue;
        const auto position = *decoded;
        const auto hash = static_cast<uint64_t>(score);
        const double dist = geo::distance(centre, position);
        const bool inside = opts.radius_m
            ? dist <= *opts.radius_m
            : geo::in_box(centre, position, opts.box_m->first, opts.box_m->second);
        if (!inside) continue;

        matches.push_back({std::move(member), dist, hash, position});
        if (opts.any && matches.size() >= *opts.count) break;
    }

    // A COUNT without ANY needs the nearest matches, so it implies ASC.
    auto order = opts.order;
    if (order == SearchOptions::Order::None && opts.count && !opts.any) {
        order = SearchOptions::Order::Asc;
    }
    if (order == SearchOptions::Order::Asc) {
        std::stable_sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
            return a.distance_m < b.distance_m;
        });
    } else if (order == SearchOptions::Order::Desc) {
        std::stable_sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
            return a.distance_m > b.distance_m;
        });
    }
    if (opts.count && matches.size() > *opts.count) matches.resize(*opts.count);

    const bool plain = !opts.with_coord && !opts.with_dist && !opts.with_hash;
    std::vector<RespValue> out;
    out.reserve(matches.size());
    for (auto& m : matches) {
        if (plain) {
            out.push_back(RespValue::bulk(std::move(m.member)));
            continue;
        }
        std::vector<RespValue> item;
        item.push_back(RespValue::bulk(std::move(m.member)));
        if (opts.with_dist) {
            item.push_back(RespValue::bulk(fmt::format("{:.4f}", m.distance_m / opts.unit)));
        }
        if (opts.with_hash) item.push_back(integer(static_cast<int64_t>(m.hash)));
        if (opts.with_coord) item.push_back(coordinates_reply(m.position));
        out.push_back(RespValue::array(std::move(item)));
    }
    return RespValue::array(std::move(out));
}

} // anonymous namespace

void register_geo_commands(CommandTable& table) {
    table.add({"geoadd",    -5, geoadd});
    table.add({"geopos",    -2, geopos});
    table.add({"geodist",   -4, geodist});
    table.add({"geosearch", -7, geosearch});
}

} // namespace tkv::command
