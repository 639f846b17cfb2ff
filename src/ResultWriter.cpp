#include "ResultWriter.hpp"
#include "ModelResult.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace CFSM {

namespace {

std::ofstream openOutput(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    return file;
}

void finish(std::ofstream& file, const std::string& filename) {
    file.close();
    if (file.fail()) {
        throw std::runtime_error("Error while writing: " + filename);
    }
    std::cout << "  Written: " << filename << std::endl;
}

} // namespace

ResultWriter::ResultWriter(const std::string& prefix) : prefix_(prefix) {
    if (prefix_.empty()) {
        throw std::invalid_argument("ResultWriter requires a non-empty prefix");
    }
}

std::vector<std::string> ResultWriter::write(const ModelResult& result) const {
    std::vector<std::string> files = {prefix_ + "_grid.dat",
                                      prefix_ + "_catalog.dat",
                                      prefix_ + "_fault.dat",
                                      prefix_ + "_summary.txt"};
    writeGrid(result, files[0]);
    writeCatalog(result, files[1]);
    writeFault(result, files[2]);
    writeSummary(result, files[3]);
    return files;
}

void ResultWriter::writeGrid(const ModelResult& result, const std::string& filename) const {
    const auto& names = scalarFieldNames();
    for (const auto& name : names) {
        auto it = result.scalarFields.find(name);
        if (it == result.scalarFields.end() || it->second.size() != result.points.size()) {
            throw std::runtime_error("Scalar field " + name + " does not match the grid");
        }
    }

    std::ofstream file = openOutput(filename);
    file << "# Coulomb stress grid\n";
    file << "# Interior points: " << result.grid.interior.size()
         << ", boundary points: " << result.grid.boundary.size() << "\n";
    file << "# Units: coordinates in m, strains dimensionless, stresses in Pa\n";
    file << "#\n";
    file << "# x y z";
    for (const auto& name : names) {
        file << " " << name;
    }
    file << "\n";

    for (size_t i = 0; i < result.points.size(); ++i) {
        const GeoPoint& p = result.points[i];
        file << std::fixed << std::setprecision(3)
             << p.x << " " << p.y << " " << p.z;
        file << std::scientific << std::setprecision(8);
        for (const auto& name : names) {
            file << " " << result.scalarFields.at(name)[i];
        }
        file << "\n";
    }
    finish(file, filename);
}

void ResultWriter::writeCatalog(const ModelResult& result, const std::string& filename) const {
    std::ofstream file = openOutput(filename);
    file << "# Catalog events inside the near field\n";
    file << "# Events: " << result.catalog.size() << "\n";
    file << "# Format: time, lat, lon, depth (km), magnitude, type, x (m), y (m), "
            "distance (m), cfs (Pa), event_id\n";
    file << "#\n";

    for (size_t i = 0; i < result.catalog.size(); ++i) {
        const CatalogEvent& e = result.catalog[i];
        double cfs = i < result.catalogCfs.size() ? result.catalogCfs[i] : 0.0;
        file << TimeUtils::formatUtc(e.time) << "\t"
             << std::fixed << std::setprecision(4) << e.latitude << "\t" << e.longitude << "\t"
             << std::setprecision(2) << e.depth << "\t" << e.magnitude << "\t"
             << e.magnitudeType << "\t"
             << std::setprecision(1) << e.x << "\t" << e.y << "\t" << e.distanceToEpicenter << "\t"
             << std::scientific << std::setprecision(6) << cfs << "\t"
             << e.eventId << "\n";
    }
    finish(file, filename);
}

void ResultWriter::writeFault(const ModelResult& result, const std::string& filename) const {
    std::ofstream file = openOutput(filename);
    file << "# Fault patches\n";
    file << "# Format: top_lat, top_lon, x (m), y (m), depth_top (m), depth_bottom (m), "
            "strike, dip, rake, slip (m), slip_strike (m), slip_dip (m), length (m), width (m)\n";
    file << "#\n";

    if (result.faultModel) {
        for (const auto& patch : result.faultModel->getPatches()) {
            const GeoPoint& c = patch.getProjectedTopCenter();
            file << std::fixed << std::setprecision(5)
                 << patch.getTopLatitude() << "\t" << patch.getTopLongitude() << "\t"
                 << std::setprecision(1)
                 << c.x << "\t" << c.y << "\t"
                 << patch.getDepthTop() << "\t" << patch.getDepthBottom() << "\t"
                 << std::setprecision(2)
                 << patch.getStrike() << "\t" << patch.getDip() << "\t" << patch.getRake() << "\t"
                 << std::setprecision(4)
                 << patch.getSlip() << "\t" << patch.getSlipStrike() << "\t" << patch.getSlipDip() << "\t"
                 << std::setprecision(1)
                 << patch.getLength() << "\t" << patch.getWidth() << "\n";
        }
    }
    finish(file, filename);
}

void ResultWriter::writeSummary(const ModelResult& result, const std::string& filename) const {
    const RunConfig& cfg = result.config;
    std::ofstream file = openOutput(filename);

    file << "# Coulomb Failure Stress Run Summary\n";
    file << "#\n";
    file << "# Rupture:\n";
    file << "rupture_source = " << cfg.rupture_source << "\n";
    if (result.faultModel) {
        const FaultModel& fm = *result.faultModel;
        if (fm.tag) file << "event_tag = " << *fm.tag << "\n";
        if (fm.description) file << "event = " << *fm.description << "\n";
        file << "date = " << TimeUtils::formatUtc(fm.date) << "\n";
        file << std::fixed << std::setprecision(4);
        file << "epicenter_lat = " << fm.getEpicenterLatitude() << "\n";
        file << "epicenter_lon = " << fm.getEpicenterLongitude() << "\n";
        if (fm.magnitude) file << "magnitude = " << *fm.magnitude << "\n";
        if (fm.depth) file << "depth = " << *fm.depth << " km\n";
        file << "projection = " << fm.getProjector().describe() << "\n";
        file << "patches = " << fm.size() << "\n";
        file << "mean_strike = " << fm.getMeanStrike() << " degrees\n";
        file << "mean_dip = " << fm.getMeanDip() << " degrees\n";
    }
    file << "#\n";
    file << "# Receiver Orientation:\n";
    file << std::fixed << std::setprecision(6);
    file << "azimuth = " << result.receiver.azimuth << " degrees\n";
    file << "dip = " << result.receiver.dip << " degrees\n";
    file << "normal = " << result.receiver.normal[0] << " " << result.receiver.normal[1]
         << " " << result.receiver.normal[2] << "\n";
    file << "in_plane = " << result.receiver.inPlane[0] << " " << result.receiver.inPlane[1]
         << " " << result.receiver.inPlane[2] << "\n";
    file << "#\n";
    file << "# Run Parameters:\n";
    file << "coefficient_of_friction = " << cfg.coefficient_of_friction << "\n";
    file << std::scientific;
    file << "lame_lambda = " << cfg.lame_lambda << " Pa\n";
    file << "shear_modulus_mu = " << cfg.shear_modulus_mu << " Pa\n";
    file << "near_field_distance = " << cfg.near_field_distance << " m\n";
    file << "spacing_grid = " << cfg.spacing_grid << " m\n";
    file << "obs_depth = " << cfg.obs_depth << " m\n";
    file << "days = " << cfg.days << "\n";
    file << "catalog_type = " << toString(cfg.catalog_type) << "\n";
    file << "#\n";
    file << "# Results:\n";
    file << "grid_points = " << result.points.size() << "\n";
    file << "catalog_events = " << result.catalog.size() << "\n";
    if (!result.cfs.empty()) {
        auto mm = std::minmax_element(result.cfs.begin(), result.cfs.end());
        file << "max_cfs = " << *mm.second << " Pa\n";
        file << "min_cfs = " << *mm.first << " Pa\n";
    }
    if (!result.catalogCfs.empty()) {
        size_t positive = std::count_if(result.catalogCfs.begin(), result.catalogCfs.end(),
                                        [](double v) { return v > 0.0; });
        file << "catalog_positive_cfs = " << positive << "\n";
    }
    file << "image = " << (result.imagePath ? *result.imagePath : std::string("none")) << "\n";

    finish(file, filename);
}

} // namespace CFSM
