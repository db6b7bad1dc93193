#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include <utility>

namespace geodetic {

namespace {

// Values of one Extent row, kept until the vertical CRS is known
struct extent_row {
    properties props;
    std::string description;
    std::optional<geographic_bbox> bbox;
    std::optional<vertical_extent> vertical;
    std::optional<std::string> vertical_crs_code;
    std::optional<temporal_extent> temporal;

    bool empty() const {
        return props.name.empty() && description.empty() && !bbox && !vertical && !temporal;
    }
};

} // namespace

extent_ptr epsg_resolver::extent_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::extent);
    auto key = to_primary_key(object_kind::extent, code);
    if (auto hit = cached<extent>(object_kind::extent, key)) return hit;

    const auto code_text = std::to_string(key);
    std::vector<extent_row> parsed;
    bool complete = true;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("extent",
            "SELECT EXTENT_CODE, EXTENT_NAME, EXTENT_DESCRIPTION, BBOX_SOUTH_BOUND_LAT, BBOX_NORTH_BOUND_LAT,"
            " BBOX_WEST_BOUND_LON, BBOX_EAST_BOUND_LON, VERTICAL_EXTENT_MIN, VERTICAL_EXTENT_MAX,"
            " VERTICAL_EXTENT_CRS_CODE, TEMPORAL_EXTENT_BEGIN, TEMPORAL_EXTENT_END, DEPRECATED"
            " FROM [Extent] WHERE EXTENT_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            extent_row e;
            e.props.name = r.string_or_empty("EXTENT_NAME");
            e.props.deprecated = r.flag("DEPRECATED");
            e.props.id = make_identifier(ctx, info, key, "", e.props.deprecated);
            e.description = r.string_or_empty("EXTENT_DESCRIPTION");

            auto south = r.optional_double("BBOX_SOUTH_BOUND_LAT");
            auto north = r.optional_double("BBOX_NORTH_BOUND_LAT");
            auto west = r.optional_double("BBOX_WEST_BOUND_LON");
            auto east = r.optional_double("BBOX_EAST_BOUND_LON");
            if (south || north || west || east) {
                geographic_bbox box(south.value_or(-90.0), north.value_or(90.0),
                                    west.value_or(-180.0), east.value_or(180.0));
                // Some rows have the latitudes inverted
                if (box.south > box.north) std::swap(box.south, box.north);
                e.bbox = box;
            }

            auto z_min = r.optional_double("VERTICAL_EXTENT_MIN");
            auto z_max = r.optional_double("VERTICAL_EXTENT_MAX");
            if (z_min || z_max) {
                vertical_extent v;
                v.minimum = z_min.value_or(z_max.value_or(0.0));
                v.maximum = z_max.value_or(z_min.value_or(0.0));
                e.vertical = v;
                if (auto crs_code = r.optional_integer("VERTICAL_EXTENT_CRS_CODE")) {
                    in_flight_key crs_key{table_for(object_kind::crs).table, {*crs_code}};
                    if (ctx.is_in_flight(crs_key)) {
                        complete = false;
                    } else {
                        e.vertical_crs_code = std::to_string(*crs_code);
                    }
                }
            }

            auto begin = r.optional_string("TEMPORAL_EXTENT_BEGIN");
            auto end = r.optional_string("TEMPORAL_EXTENT_END");
            if (begin || end) {
                e.temporal = temporal_extent{begin.value_or(""), end.value_or("")};
            }
            if (!e.empty()) {
                parsed.push_back(std::move(e));
            }
        }
    }

    // The vertical CRS may itself have usages pointing back to this extent,
    // so it is resolved only once this extent is no longer in flight.
    extent_ptr result;
    for (auto& e : parsed) {
        if (e.vertical_crs_code) {
            e.vertical->vertical_crs = crs_of_kind(ctx, *e.vertical_crs_code, object_kind::vertical_crs);
        }
        auto object = std::make_shared<const extent>(std::move(e.props), std::move(e.description),
                                                     std::move(e.bbox), std::move(e.vertical),
                                                     std::move(e.temporal));
        result = ensure_singleton<extent>(result, object, code_text);
    }
    if (!result) {
        throw no_such_code_error("extent", code);
    }
    if (complete) {
        remember(object_kind::extent, key, result);
    }
    return result;
}

} // namespace geodetic
