#include <qcloudsim/core/device_profile.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/job.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace qcloudsim::core {

namespace {

DeviceProfile make_profile(std::string_view model, std::optional<double> clops,
                           std::optional<double> qvol, double interval, double duration) {
    DeviceProfile profile;
    profile.model = std::string(model);
    profile.clops = clops;
    profile.quantum_volume = qvol;
    profile.maintenance = MaintenanceParams{false, interval, duration};
    return profile;
}

// Catalog constants per model. Maintenance windows are stored but off by default.
const std::vector<DeviceProfile>& registry() {
    static const std::vector<DeviceProfile> presets = {
        make_profile("ibm_guadalupe", 1400.0, 32.0, 100, 15),
        make_profile("ibm_tokyo", 1400.0, 32.0, 120, 15),
        make_profile("ibm_montreal", 1400.0, 32.0, 140, 25),
        make_profile("ibm_rochester", 1400.0, 32.0, 140, 25),
        make_profile("ibm_hummingbird", 1400.0, 128.0, 140, 25),
        make_profile("ibm_marrakesh", 195000.0, 128.0, 180, 40),
        make_profile("ibm_fez", 195000.0, 128.0, 120, 60),
        make_profile("ibm_torino", 210000.0, 128.0, 150, 45),
        make_profile("ibm_quebec", 32000.0, 128.0, 150, 45),
        make_profile("ibm_kyiv", 30000.0, 128.0, 160, 40),
        make_profile("ibm_brisbane", 180000.0, 128.0, 180, 60),
        make_profile("ibm_sherbrooke", 30000.0, 128.0, 120, 40),
        make_profile("ibm_kawasaki", 29000.0, 128.0, 140, 40),
        make_profile("ibm_rensselaer", 32000.0, 128.0, 120, 30),
        make_profile("ibm_brussels", 220000.0, 128.0, 160, 40),
        make_profile("ibm_strasbourg", 220000.0, 128.0, 180, 60),
        make_profile("amazon_dwave", std::nullopt, std::nullopt, 140, 25),
        make_profile("chimera_dwave_72", std::nullopt, std::nullopt, 200, 25),
        make_profile("chimera_dwave_128", std::nullopt, std::nullopt, 250, 40),
        make_profile("amazon_rigetti", std::nullopt, std::nullopt, 250, 40),
        make_profile("google_sycamore", std::nullopt, std::nullopt, 150, 20),
        make_profile("google_sycamore_53", std::nullopt, std::nullopt, 140, 25),
    };
    return presets;
}

} // namespace

Duration qpu_processing_time(const DeviceProfile& profile, const Job& job) {
    if (profile.process_time) {
        return duration_from_units(*profile.process_time);
    }
    if (profile.clops && profile.quantum_volume) {
        double units = kCircuitLayers * kCircuitTemplates * static_cast<double>(job.num_shots) *
                       std::log2(*profile.quantum_volume) / *profile.clops / 60.0;
        return duration_from_units(units);
    }
    return duration_from_units(static_cast<double>(job.num_qubits) * 100.0);
}

double single_device_fidelity(const DeviceProfile& profile, const Job& job) {
    double gates = std::pow(1.0 - profile.errors.single_qubit, static_cast<double>(job.depth));
    double readout = std::pow(1.0 - profile.errors.readout, static_cast<double>(job.num_qubits));
    return gates * readout;
}

const DeviceProfile& device_preset(std::string_view name) {
    const auto& presets = registry();
    auto it = std::find_if(presets.begin(), presets.end(),
                           [name](const DeviceProfile& p) { return p.model == name; });
    if (it == presets.end()) {
        throw OutOfRangeError("Unknown device preset: " + std::string(name));
    }
    return *it;
}

std::vector<std::string_view> preset_names() {
    std::vector<std::string_view> names;
    for (const auto& profile : registry()) {
        names.emplace_back(profile.model);
    }
    return names;
}

} // namespace qcloudsim::core
