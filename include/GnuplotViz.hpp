#ifndef GNUPLOT_VIZ_HPP
#define GNUPLOT_VIZ_HPP

#include <string>
#include <vector>

namespace CFSM {

struct ModelResult;

/**
 * @brief Optional rendering of a run
 *
 * render() may throw; callers treat a failure as "no image" and carry on.
 */
class Visualizer {
public:
    virtual ~Visualizer() = default;

    // Returns the path of the written image
    virtual std::string render(const ModelResult& result) = 0;
};

/**
 * @brief Map view of the Coulomb stress field through gnuplot
 *
 * Writes <name>_cfs.dat, <name>_fault.dat, <name>_catalog.dat and
 * <name>.gp into the output directory, then runs gnuplot there to produce
 * <name>.png. Grid values are shown in MPa and clipped to ±0.1 MPa.
 */
class GnuplotViz : public Visualizer {
public:
    GnuplotViz(const std::string& output_dir = "plots",
               const std::string& name = "cfs");

    std::string render(const ModelResult& result) override;

    void setOutputDir(const std::string& dir) { output_dir_ = dir; }
    const std::string& getOutputDir() const { return output_dir_; }

    static std::string getPalette();

    /// Text for a single-quoted gnuplot string; quotes are doubled
    static std::string quoted(const std::string& text);

private:
    std::string output_dir_;
    std::string name_;

    void ensureOutputDir() const;
    void writeGrid(const ModelResult& result, const std::string& filename) const;
    void writeFault(const ModelResult& result, const std::string& filename) const;
    void writeCatalog(const ModelResult& result, const std::string& filename) const;
    void writeScript(const ModelResult& result, const std::string& filename) const;
};

} // namespace CFSM

#endif // GNUPLOT_VIZ_HPP
