#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include <string>
#include <vector>

namespace CFSM {

struct ModelResult;

/**
 * @brief ASCII output of a model run
 *
 * Files written for a prefix P:
 *   P_grid.dat     x, y, z (m) and the 36 scalar fields per grid point
 *   P_catalog.dat  correlated events with their Coulomb stress
 *   P_fault.dat    patch geometry and slip
 *   P_summary.txt  run parameters and headline numbers
 * Every file starts with '#' comment lines describing its columns.
 */
class ResultWriter {
public:
    explicit ResultWriter(const std::string& prefix);

    // Writes all four files and returns their paths
    std::vector<std::string> write(const ModelResult& result) const;

    void writeGrid(const ModelResult& result, const std::string& filename) const;
    void writeCatalog(const ModelResult& result, const std::string& filename) const;
    void writeFault(const ModelResult& result, const std::string& filename) const;
    void writeSummary(const ModelResult& result, const std::string& filename) const;

    const std::string& getPrefix() const { return prefix_; }

private:
    std::string prefix_;
};

} // namespace CFSM

#endif // RESULT_WRITER_HPP
