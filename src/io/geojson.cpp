#include "floodmap/io/geojson.hpp"
#include "floodmap/core/errors.hpp"
#include "floodmap/core/utils.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace floodmap::io {

using json = nlohmann::json;

namespace {

json load_json(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw GeoJsonError("Cannot open " + path.string());
    }
    try {
        return json::parse(in);
    } catch (const json::exception& e) {
        throw GeoJsonError("Cannot parse " + path.string() + ": " + e.what());
    }
}

geometry::Ring parse_ring(const json& coords) {
    geometry::Ring ring;
    ring.reserve(coords.size());
    for (const auto& c : coords) {
        ring.push_back({c.at(0).get<double>(), c.at(1).get<double>()});
    }
    if (ring.size() > 1) {
        const auto& first = ring.front();
        const auto& last = ring.back();
        if (first.x == last.x && first.y == last.y) {
            ring.pop_back();
        }
    }
    return ring;
}

geometry::Polygon parse_polygon(const json& coords) {
    geometry::Polygon poly;
    for (size_t i = 0; i < coords.size(); ++i) {
        if (i == 0) {
            poly.outer = parse_ring(coords[i]);
        } else {
            poly.holes.push_back(parse_ring(coords[i]));
        }
    }
    return poly;
}

void collect_polygons(const json& geom, std::vector<geometry::Polygon>& out) {
    if (geom.is_null()) return;
    const std::string type = geom.at("type").get<std::string>();
    if (type == "Polygon") {
        out.push_back(parse_polygon(geom.at("coordinates")));
    } else if (type == "MultiPolygon") {
        for (const auto& part : geom.at("coordinates")) {
            out.push_back(parse_polygon(part));
        }
    } else if (type == "GeometryCollection") {
        for (const auto& g : geom.at("geometries")) {
            collect_polygons(g, out);
        }
    }
}

void collect_lines(const json& geom, std::vector<geometry::LineString>& out) {
    if (geom.is_null()) return;
    const std::string type = geom.at("type").get<std::string>();
    if (type == "LineString") {
        geometry::LineString line;
        for (const auto& c : geom.at("coordinates")) {
            line.push_back({c.at(0).get<double>(), c.at(1).get<double>()});
        }
        out.push_back(std::move(line));
    } else if (type == "MultiLineString") {
        for (const auto& part : geom.at("coordinates")) {
            geometry::LineString line;
            for (const auto& c : part) {
                line.push_back({c.at(0).get<double>(), c.at(1).get<double>()});
            }
            out.push_back(std::move(line));
        }
    }
}

// Feature list of a FeatureCollection, a lone Feature or a bare geometry.
std::vector<json> features_of(const json& doc) {
    const std::string type = doc.at("type").get<std::string>();
    if (type == "FeatureCollection") {
        return doc.at("features").get<std::vector<json>>();
    }
    if (type == "Feature") {
        return {doc};
    }
    return {json{{"type", "Feature"}, {"geometry", doc}, {"properties", json::object()}}};
}

json ring_coords(const geometry::Ring& ring) {
    json coords = json::array();
    for (const auto& p : ring) {
        coords.push_back({p.x, p.y});
    }
    if (!ring.empty()) {
        coords.push_back({ring.front().x, ring.front().y});
    }
    return coords;
}

} // namespace

geometry::Polygon read_footprint(const fs::path& path) {
    const json doc = load_json(path);
    std::vector<geometry::Polygon> parts;
    try {
        for (const auto& feature : features_of(doc)) {
            collect_polygons(feature.value("geometry", json()), parts);
        }
    } catch (const json::exception& e) {
        throw GeoJsonError("Malformed footprint in " + path.string() + ": " + e.what());
    }

    if (parts.empty()) {
        throw GeoJsonError("No polygon found in " + path.string());
    }

    size_t best = 0;
    double best_area = -1.0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const double a = geometry::polygon_area(parts[i]);
        if (a > best_area) {
            best_area = a;
            best = i;
        }
    }
    return parts[best];
}

std::vector<RiverSegment> read_rivers(const fs::path& path, const std::string& size_property) {
    const json doc = load_json(path);
    std::vector<RiverSegment> rivers;
    try {
        for (const auto& feature : features_of(doc)) {
            double size = 0.0;
            const json props = feature.value("properties", json::object());
            if (props.is_object() && props.contains(size_property) &&
                props.at(size_property).is_number()) {
                size = props.at(size_property).get<double>();
            }

            std::vector<geometry::LineString> lines;
            collect_lines(feature.value("geometry", json()), lines);
            for (auto& line : lines) {
                if (line.empty()) continue;
                rivers.push_back({std::move(line), size});
            }
        }
    } catch (const json::exception& e) {
        throw GeoJsonError("Malformed river network in " + path.string() + ": " + e.what());
    }
    return rivers;
}

std::vector<geometry::Polygon> read_prescribed_tiles(const fs::path& path) {
    const json doc = load_json(path);
    std::vector<geometry::Polygon> tiles;
    try {
        for (const auto& feature : features_of(doc)) {
            const json props = feature.value("properties", json::object());
            if (props.is_object() && props.contains("disposition") &&
                props.at("disposition").is_string() &&
                string_to_disposition(props.at("disposition").get<std::string>()) ==
                    TileDisposition::OUTSIDE) {
                continue;
            }
            collect_polygons(feature.value("geometry", json()), tiles);
        }
    } catch (const json::exception& e) {
        throw GeoJsonError("Malformed tile layer in " + path.string() + ": " + e.what());
    }
    return tiles;
}

void write_visit_layer(const fs::path& path, const std::vector<search::VisitRecord>& visits,
                       const std::string& crs) {
    json doc;
    doc["type"] = "FeatureCollection";
    if (!crs.empty()) {
        doc["crs"] = {{"type", "name"}, {"properties", {{"name", crs}}}};
    }

    json features = json::array();
    for (const auto& v : visits) {
        json coords = json::array();
        coords.push_back(ring_coords(v.footprint.outer));
        for (const auto& h : v.footprint.holes) {
            coords.push_back(ring_coords(h));
        }

        json feature;
        feature["type"] = "Feature";
        feature["geometry"] = {{"type", "Polygon"}, {"coordinates", coords}};
        feature["properties"] = {
            {"x", v.coord.x},
            {"y", v.coord.y},
            {"disposition", disposition_to_string(v.disposition)},
            {"background_px", v.counts.background},
            {"permanent_water_px", v.counts.permanent_water},
            {"flood_px", v.counts.flood}
        };
        features.push_back(std::move(feature));
    }
    doc["features"] = std::move(features);

    core::write_text(path, doc.dump(2) + "\n");
}

} // namespace floodmap::io
