#include "GnuplotViz.hpp"
#include "ModelResult.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace CFSM {

namespace {

constexpr double PA_TO_MPA = 1e-6;
constexpr double CFS_LIMIT = 1e5;   // Pa, color scale clip

std::ofstream openOutput(const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write plot file: " + path);
    }
    file << std::setprecision(10);
    return file;
}

} // namespace

GnuplotViz::GnuplotViz(const std::string& output_dir, const std::string& name)
    : output_dir_(output_dir), name_(name) {}

std::string GnuplotViz::getPalette() {
    // Diverging blue-white-red, centred on zero
    return "defined ( 0 '#08306b', 1 '#4292c6', 2 '#ffffff', 3 '#ef3b2c', 4 '#67000d' )";
}

void GnuplotViz::ensureOutputDir() const {
    if (mkdir(output_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
        throw std::runtime_error("Cannot create plot directory " + output_dir_ + ": " +
                                 std::strerror(errno));
    }
}

void GnuplotViz::writeGrid(const ModelResult& result, const std::string& filename) const {
    std::ofstream file = openOutput(filename);
    file << "# x(km) y(km) cfs(MPa)\n";
    for (size_t i = 0; i < result.points.size() && i < result.cfs.size(); ++i) {
        double v = std::max(-CFS_LIMIT, std::min(CFS_LIMIT, result.cfs[i]));
        file << result.points[i].x / KM2M << " " << result.points[i].y / KM2M << " "
             << v * PA_TO_MPA << "\n";
    }
}

void GnuplotViz::writeFault(const ModelResult& result, const std::string& filename) const {
    std::ofstream file = openOutput(filename);
    file << "# Patch outlines x(km) y(km)\n";
    if (!result.faultModel) return;
    for (const auto& patch : result.faultModel->getPatches()) {
        const auto& c = patch.getProjectedCorners();
        // top(+) top(-) bottom(-) bottom(+) back to top(+)
        for (int k : {0, 1, 3, 2, 0}) {
            file << c[k].x / KM2M << " " << c[k].y / KM2M << "\n";
        }
        file << "\n";
    }
}

void GnuplotViz::writeCatalog(const ModelResult& result, const std::string& filename) const {
    std::ofstream file = openOutput(filename);
    file << "# x(km) y(km) magnitude\n";
    for (const auto& e : result.catalog) {
        file << e.x / KM2M << " " << e.y / KM2M << " " << e.magnitude << "\n";
    }
}

std::string GnuplotViz::quoted(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    return out;
}

void GnuplotViz::writeScript(const ModelResult& result, const std::string& filename) const {
    std::ofstream script = openOutput(filename);

    std::string title = "Coulomb stress change";
    if (result.faultModel && result.faultModel->tag) {
        title += " - " + *result.faultModel->tag;
    }

    script << "set terminal pngcairo size 1400,1100 enhanced font 'Arial,14'\n";
    script << "set output '" << name_ << ".png'\n\n";

    script << "set title '" << quoted(title) << " (depth " << -result.config.obs_depth / KM2M
           << " km)' font 'Arial,16'\n";
    script << "set xlabel 'Easting (km)'\n";
    script << "set ylabel 'Northing (km)'\n";
    script << "set size ratio -1\n";
    script << "set palette " << getPalette() << "\n";
    script << "set cbrange [" << -CFS_LIMIT * PA_TO_MPA << ":" << CFS_LIMIT * PA_TO_MPA << "]\n";
    script << "set cblabel 'CFS (MPa)'\n\n";

    script << "plot '" << name_ << "_cfs.dat' using 1:2:3 with points pt 5 ps 0.4 palette notitle, \\\n";
    script << "     '" << name_ << "_fault.dat' using 1:2 with lines lw 1 lc rgb 'black' title 'Fault patches'";
    if (!result.catalog.empty()) {
        script << ", \\\n     '" << name_ << "_catalog.dat' using 1:2 with points pt 6 ps 1 "
               << "lc rgb 'black' title 'Aftershocks'";
    }
    script << "\n";
}

std::string GnuplotViz::render(const ModelResult& result) {
    ensureOutputDir();

    const std::string base = output_dir_ + "/" + name_;
    writeGrid(result, base + "_cfs.dat");
    writeFault(result, base + "_fault.dat");
    writeCatalog(result, base + "_catalog.dat");
    writeScript(result, base + ".gp");

    // Execute gnuplot from output directory
    std::string cmd = "cd '" + output_dir_ + "' && gnuplot " + name_ + ".gp 2>/dev/null";
    int status = std::system(cmd.c_str());
    if (status != 0) {
        std::ostringstream oss;
        oss << "gnuplot failed (status " << status << ") for " << base << ".gp";
        throw std::runtime_error(oss.str());
    }
    return base + ".png";
}

} // namespace CFSM
