/**
 * @file kernels.cpp
 * @brief pybind11 bindings for the 2D Maxwell FDTD kernels
 *
 * Exposes the C++ simulator, session and kernels to Python with NumPy array
 * support. 2D arrays are (height, width), C-contiguous float32.
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "diagnostics.hpp"
#include "fdtd_step.hpp"
#include "logging.hpp"
#include "maps.hpp"
#include "serialization.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "simulator.hpp"

#include <algorithm>
#include <initializer_list>

namespace py = pybind11;

using FloatArray = py::array_t<float, py::array::c_style>;

// Helper to get raw pointer from numpy array with validation
inline float* get_float_ptr(FloatArray& arr, const std::string& name) {
    auto info = arr.request();
    if (info.ndim != 2) {
        throw std::runtime_error(name + " must be 2-dimensional");
    }
    return static_cast<float*>(info.ptr);
}

inline const float* get_float_ptr_const(const FloatArray& arr, const std::string& name) {
    auto info = arr.request();
    if (info.ndim != 2) {
        throw std::runtime_error(name + " must be 2-dimensional");
    }
    return static_cast<const float*>(info.ptr);
}

// Extract shape from numpy array, (height, width) -> {nx, ny}
maxwell::GridShape get_shape(const py::array& arr) {
    auto info = arr.request();
    if (info.ndim != 2) {
        throw std::runtime_error("Array must be 2-dimensional");
    }
    return maxwell::GridShape{
        static_cast<int>(info.shape[1]),
        static_cast<int>(info.shape[0])
    };
}

// Verify arrays have matching shapes
void check_shapes_match(const maxwell::GridShape& a, const maxwell::GridShape& b,
                        const std::string& name_a, const std::string& name_b) {
    if (a != b) {
        throw std::runtime_error(name_a + " and " + name_b + " must have the same shape");
    }
}

// Helper to copy numpy array to std::vector<float>
inline std::vector<float> array_to_vector(const FloatArray& arr) {
    auto info = arr.request();
    const float* data = static_cast<const float*>(info.ptr);
    return std::vector<float>(data, data + info.size);
}

// (height, width) view of a channel owned by `owner`, no copy.
// The view aliases the vector's storage: it dangles once set_grid_size
// reallocates the fields, so callers must fetch fresh views after a resize.
py::array_t<float> channel_view(const std::vector<float>& channel,
                                const maxwell::GridShape& shape, py::handle owner) {
    return py::array_t<float>(
        {static_cast<py::ssize_t>(shape.ny), static_cast<py::ssize_t>(shape.nx)},
        {static_cast<py::ssize_t>(shape.nx * sizeof(float)), static_cast<py::ssize_t>(sizeof(float))},
        channel.data(),
        owner
    );
}

py::tuple field_view(const maxwell::VectorField& f, const maxwell::GridShape& shape,
                     py::handle owner) {
    return py::make_tuple(
        channel_view(f.x, shape, owner),
        channel_view(f.y, shape, owner),
        channel_view(f.z, shape, owner)
    );
}

py::array_t<float> vector_to_array(const std::vector<float>& values, const maxwell::GridShape& shape) {
    py::array_t<float> out({static_cast<py::ssize_t>(shape.ny), static_cast<py::ssize_t>(shape.nx)});
    std::copy(values.begin(), values.end(), out.mutable_data());
    return out;
}

maxwell::MaterialMap arrays_to_material_map(const FloatArray& permittivity,
                                            const FloatArray& permeability,
                                            const FloatArray& conductivity) {
    auto shape = get_shape(permittivity);
    check_shapes_match(shape, get_shape(permeability), "permittivity", "permeability");
    check_shapes_match(shape, get_shape(conductivity), "permittivity", "conductivity");

    maxwell::MaterialMap map;
    map.shape = shape;
    map.permittivity = array_to_vector(permittivity);
    map.permeability = array_to_vector(permeability);
    map.conductivity = array_to_vector(conductivity);
    return map;
}

PYBIND11_MODULE(_kernels, m) {
    m.doc() = "2D Maxwell FDTD simulation kernels (C++ accelerated)";

    // Version and build info
    m.attr("__version__") = MAXWELL_KERNELS_VERSION;
#if MAXWELL_HAS_OPENMP
    m.attr("has_openmp") = true;
#else
    m.attr("has_openmp") = false;
#endif

    m.def("get_num_threads", &maxwell::get_num_threads,
          "Get the number of OpenMP threads available");
    m.def("set_num_threads", &maxwell::set_num_threads,
          "Set the number of OpenMP threads", py::arg("n"));

    py::register_exception<maxwell::DecodeError>(m, "DecodeError", PyExc_ValueError);

    py::enum_<maxwell::LogLevel>(m, "LogLevel")
        .value("Error", maxwell::LogLevel::Error)
        .value("Warning", maxwell::LogLevel::Warning)
        .value("Info", maxwell::LogLevel::Info)
        .value("Debug", maxwell::LogLevel::Debug);

    m.def("set_log_level", &maxwell::set_log_level, py::arg("level"));
    m.def("log_level", &maxwell::log_level);

    // ==========================================================================
    // Grid, drawing and material types
    // ==========================================================================

    py::class_<maxwell::GridShape>(m, "GridShape", "Grid dimensions in cells")
        .def(py::init([](int nx, int ny) { return maxwell::GridShape{nx, ny}; }),
             py::arg("nx"), py::arg("ny"))
        .def_readwrite("nx", &maxwell::GridShape::nx)
        .def_readwrite("ny", &maxwell::GridShape::ny)
        .def("size", &maxwell::GridShape::size)
        .def("__eq__", &maxwell::GridShape::operator==)
        .def("__repr__", [](const maxwell::GridShape& s) {
            return "GridShape(" + std::to_string(s.nx) + ", " + std::to_string(s.ny) + ")";
        });

    py::enum_<maxwell::DrawShape>(m, "DrawShape")
        .value("Square", maxwell::DrawShape::Square)
        .value("Ellipse", maxwell::DrawShape::Ellipse);

    py::class_<maxwell::DrawInfo>(m, "DrawInfo",
        "Shape, center and extent (half-size or radius) in cell units")
        .def(py::init<>())
        .def_readwrite("shape", &maxwell::DrawInfo::shape)
        .def_readwrite("center", &maxwell::DrawInfo::center)
        .def_readwrite("extent", &maxwell::DrawInfo::extent)
        .def_readwrite("value", &maxwell::DrawInfo::value);

    m.def("make_draw_square_info", &maxwell::make_draw_square_info,
          py::arg("center"), py::arg("half_size"), py::arg("value"));
    m.def("make_draw_ellipse_info", &maxwell::make_draw_ellipse_info,
          py::arg("center"), py::arg("radius"), py::arg("value"));

    py::enum_<maxwell::MaterialType>(m, "MaterialType")
        .value("Permittivity", maxwell::MaterialType::Permittivity)
        .value("Permeability", maxwell::MaterialType::Permeability)
        .value("Conductivity", maxwell::MaterialType::Conductivity);

    py::class_<maxwell::MaterialMap>(m, "MaterialMap", "Standalone copy of a grid's material")
        .def(py::init([](const FloatArray& permittivity, const FloatArray& permeability,
                         const FloatArray& conductivity) {
            return arrays_to_material_map(permittivity, permeability, conductivity);
        }), py::arg("permittivity"), py::arg("permeability"), py::arg("conductivity"))
        .def_readonly("shape", &maxwell::MaterialMap::shape)
        .def_property_readonly("permittivity", [](const maxwell::MaterialMap& map) {
            return vector_to_array(map.permittivity, map.shape);
        })
        .def_property_readonly("permeability", [](const maxwell::MaterialMap& map) {
            return vector_to_array(map.permeability, map.shape);
        })
        .def_property_readonly("conductivity", [](const maxwell::MaterialMap& map) {
            return vector_to_array(map.conductivity, map.shape);
        });

    m.def("default_material_map", &maxwell::default_material_map, py::arg("shape"));

    // ==========================================================================
    // Sources and settings
    // ==========================================================================

    py::class_<maxwell::PointSource>(m, "PointSource",
        "Oscillating point source: -A * cos(2 pi f t) for 0 <= t <= turn_off_time")
        .def(py::init<>())
        .def(py::init([](maxwell::Vec2 position, float amplitude, float frequency,
                         std::optional<float> turn_off_time) {
            maxwell::PointSource s;
            s.position = position;
            s.amplitude = amplitude;
            s.frequency = frequency;
            s.turn_off_time = turn_off_time;
            return s;
        }), py::arg("position"), py::arg("amplitude"), py::arg("frequency"),
            py::arg("turn_off_time") = py::none())
        .def_readwrite("position", &maxwell::PointSource::position)
        .def_readwrite("amplitude", &maxwell::PointSource::amplitude)
        .def_readwrite("frequency", &maxwell::PointSource::frequency)
        .def_readwrite("turn_off_time", &maxwell::PointSource::turn_off_time)
        .def("value", [](const maxwell::PointSource& s, double t) {
            return maxwell::source_value(s, t);
        }, py::arg("t"));

    py::class_<maxwell::SimulationSettings>(m, "SimulationSettings")
        .def(py::init<>())
        .def_readwrite("dt", &maxwell::SimulationSettings::dt)
        .def_readwrite("grid_size", &maxwell::SimulationSettings::grid_size)
        .def_readwrite("simulation_speed", &maxwell::SimulationSettings::simulation_speed)
        .def_readwrite("cell_size", &maxwell::SimulationSettings::cell_size)
        .def("validate", &maxwell::validate_settings)
        .def("to_json", [](const maxwell::SimulationSettings& s) {
            return maxwell::settings_to_json(s).dump();
        })
        .def_static("from_json", [](const std::string& text) {
            nlohmann::json j;
            try {
                j = nlohmann::json::parse(text);
            } catch (const nlohmann::json::parse_error& e) {
                throw maxwell::DecodeError(std::string("malformed settings JSON: ") + e.what());
            }
            return maxwell::settings_from_json(j);
        }, py::arg("text"));

    // ==========================================================================
    // Serialization and maps
    // ==========================================================================

    m.def("encode_material_map",
        [](const maxwell::MaterialMap& map, bool compress, uint32_t version) {
            const std::vector<uint8_t> bytes = maxwell::encode_material_map(map, compress, version);
            return py::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        },
        py::arg("map"), py::arg("compress") = true,
        py::arg("version") = maxwell::kMaterialMapVersion);

    m.def("decode_material_map", [](const py::bytes& data) {
        const std::string raw = data;
        return maxwell::decode_material_map(
            reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
    }, py::arg("data"));

    py::class_<maxwell::SimulatorMap>(m, "SimulatorMap", "Material, settings and sources of a scene")
        .def(py::init<>())
        .def_readwrite("material_map", &maxwell::SimulatorMap::material_map)
        .def_readwrite("settings", &maxwell::SimulatorMap::settings)
        .def_readwrite("sources", &maxwell::SimulatorMap::sources)
        .def("dumps", &maxwell::dump_simulator_map, py::arg("compress") = true)
        .def_static("loads", &maxwell::parse_simulator_map, py::arg("text"));

    m.def("empty_map", &maxwell::empty_map);
    m.def("double_slit_map", &maxwell::double_slit_map);
    m.def("fiber_optics_map", &maxwell::fiber_optics_map);
    m.def("builtin_map_names", &maxwell::builtin_map_names);
    m.def("builtin_map", &maxwell::builtin_map, py::arg("name"));

    // ==========================================================================
    // Stateless step kernels on NumPy arrays
    // ==========================================================================

    m.def("update_electric",
        [](const FloatArray& ex_prev, const FloatArray& ey_prev, const FloatArray& ez_prev,
           const FloatArray& hx, const FloatArray& hy, const FloatArray& hz,
           const FloatArray& alpha_e, const FloatArray& beta_e,
           FloatArray& ex, FloatArray& ey, FloatArray& ez) {

            auto shape = get_shape(ez);
            for (const FloatArray* arr : std::initializer_list<const FloatArray*>{
                     &ex_prev, &ey_prev, &ez_prev, &hx, &hy, &hz, &alpha_e, &beta_e, &ex, &ey}) {
                check_shapes_match(shape, get_shape(*arr), "ez", "every input");
            }

            maxwell::update_electric(
                get_float_ptr_const(ex_prev, "ex_prev"), get_float_ptr_const(ey_prev, "ey_prev"),
                get_float_ptr_const(ez_prev, "ez_prev"),
                get_float_ptr_const(hx, "hx"), get_float_ptr_const(hy, "hy"),
                get_float_ptr_const(hz, "hz"),
                get_float_ptr_const(alpha_e, "alpha_e"), get_float_ptr_const(beta_e, "beta_e"),
                get_float_ptr(ex, "ex"), get_float_ptr(ey, "ey"), get_float_ptr(ez, "ez"),
                shape);
        },
        R"doc(
        Electric curl update from the magnetic field.

        Args:
            ex_prev, ey_prev, ez_prev: Electric field read buffer (ny, nx) float32
            hx, hy, hz: Magnetic field (ny, nx) float32
            alpha_e, beta_e: Electric lossy-medium coefficients (ny, nx) float32
            ex, ey, ez: Electric field write buffer (ny, nx) float32, modified in place
        )doc",
        py::arg("ex_prev"), py::arg("ey_prev"), py::arg("ez_prev"),
        py::arg("hx"), py::arg("hy"), py::arg("hz"),
        py::arg("alpha_e"), py::arg("beta_e"),
        py::arg("ex"), py::arg("ey"), py::arg("ez")
    );

    m.def("update_magnetic",
        [](const FloatArray& hx_prev, const FloatArray& hy_prev, const FloatArray& hz_prev,
           const FloatArray& ex, const FloatArray& ey, const FloatArray& ez,
           const FloatArray& alpha_h, const FloatArray& beta_h,
           FloatArray& hx, FloatArray& hy, FloatArray& hz) {

            auto shape = get_shape(hz);
            for (const FloatArray* arr : std::initializer_list<const FloatArray*>{
                     &hx_prev, &hy_prev, &hz_prev, &ex, &ey, &ez, &alpha_h, &beta_h, &hx, &hy}) {
                check_shapes_match(shape, get_shape(*arr), "hz", "every input");
            }

            maxwell::update_magnetic(
                get_float_ptr_const(hx_prev, "hx_prev"), get_float_ptr_const(hy_prev, "hy_prev"),
                get_float_ptr_const(hz_prev, "hz_prev"),
                get_float_ptr_const(ex, "ex"), get_float_ptr_const(ey, "ey"),
                get_float_ptr_const(ez, "ez"),
                get_float_ptr_const(alpha_h, "alpha_h"), get_float_ptr_const(beta_h, "beta_h"),
                get_float_ptr(hx, "hx"), get_float_ptr(hy, "hy"), get_float_ptr(hz, "hz"),
                shape);
        },
        R"doc(
        Magnetic curl update from the electric field.

        Args:
            hx_prev, hy_prev, hz_prev: Magnetic field read buffer (ny, nx) float32
            ex, ey, ez: Electric field (ny, nx) float32
            alpha_h, beta_h: Magnetic lossy-medium coefficients (ny, nx) float32
            hx, hy, hz: Magnetic field write buffer (ny, nx) float32, modified in place
        )doc",
        py::arg("hx_prev"), py::arg("hy_prev"), py::arg("hz_prev"),
        py::arg("ex"), py::arg("ey"), py::arg("ez"),
        py::arg("alpha_h"), py::arg("beta_h"),
        py::arg("hx"), py::arg("hy"), py::arg("hz")
    );

    // ==========================================================================
    // Simulator
    // ==========================================================================

    py::class_<maxwell::Simulator>(m, "Simulator",
        "Double-buffered 2D FDTD simulator. Field views are zero-copy: they are stale "
        "after the next step and invalid after set_grid_size; copy them to keep data.")
        .def(py::init<const maxwell::GridShape&, float, bool, float>(),
             py::arg("shape"), py::arg("cell_size"),
             py::arg("reflective_boundary") = false, py::arg("dt") = 0.02f)
        .def("step_electric", &maxwell::Simulator::step_electric, py::arg("dt"))
        .def("step_magnetic", &maxwell::Simulator::step_magnetic, py::arg("dt"))
        .def("reset_fields", &maxwell::Simulator::reset_fields)
        .def("reset_materials", &maxwell::Simulator::reset_materials)
        .def("inject_signal", &maxwell::Simulator::inject_signal,
             py::arg("info"), py::arg("dt"))
        .def("draw_material", &maxwell::Simulator::draw_material,
             py::arg("type"), py::arg("info"))
        .def("load_material",
             py::overload_cast<const maxwell::MaterialMap&>(&maxwell::Simulator::load_material),
             py::arg("map"))
        .def("load_material_from_components",
            [](maxwell::Simulator& sim, const FloatArray& permittivity,
               const FloatArray& permeability, const FloatArray& conductivity) {
                sim.load_material(arrays_to_material_map(permittivity, permeability, conductivity));
            },
            py::arg("permittivity"), py::arg("permeability"), py::arg("conductivity"))
        .def("get_material", &maxwell::Simulator::get_material)
        .def("set_grid_size", &maxwell::Simulator::set_grid_size,
             py::arg("shape"), py::arg("preserve_material") = true)
        .def("set_cell_size", &maxwell::Simulator::set_cell_size, py::arg("cell_size"))
        .def("set_reflective_boundary", &maxwell::Simulator::set_reflective_boundary,
             py::arg("reflective"))
        .def_property_readonly("grid_size", &maxwell::Simulator::grid_size)
        .def_property_readonly("cell_size", &maxwell::Simulator::cell_size)
        .def_property_readonly("reflective_boundary", &maxwell::Simulator::reflective_boundary)
        .def_property_readonly("time", &maxwell::Simulator::time)
        .def_property_readonly("coefficient_updates", &maxwell::Simulator::coefficient_updates)
        .def("electric_field", [](py::object self) {
            auto& sim = self.cast<maxwell::Simulator&>();
            return field_view(sim.electric_field(), sim.grid_size(), self);
        })
        .def("magnetic_field", [](py::object self) {
            auto& sim = self.cast<maxwell::Simulator&>();
            return field_view(sim.magnetic_field(), sim.grid_size(), self);
        })
        .def("electric_source_field", [](py::object self) {
            const auto& sim = self.cast<const maxwell::Simulator&>();
            return field_view(sim.electric_source_field(), sim.grid_size(), self);
        })
        .def("energy", [](const maxwell::Simulator& sim) {
            const maxwell::FieldEnergy e =
                maxwell::compute_field_energy(sim.electric_field(), sim.magnetic_field());
            return py::make_tuple(e.electric, e.magnetic, e.total());
        })
        .def("region_energy",
            [](const maxwell::Simulator& sim, int i0, int j0, int i1, int j1) {
                const maxwell::FieldEnergy e = maxwell::compute_region_energy(
                    sim.electric_field(), sim.magnetic_field(), sim.grid_size(), i0, j0, i1, j1);
                return py::make_tuple(e.electric, e.magnetic, e.total());
            },
            py::arg("i0"), py::arg("j0"), py::arg("i1"), py::arg("j1"))
        .def("energy_density",
            [](const maxwell::Simulator& sim, bool show_electric, bool show_magnetic) {
                const maxwell::EnergyDensity d = maxwell::compute_energy_density(
                    sim.electric_field(), sim.magnetic_field(), sim.material(),
                    show_electric, show_magnetic);
                return py::make_tuple(vector_to_array(d.electric, sim.grid_size()),
                                      vector_to_array(d.magnetic, sim.grid_size()));
            },
            py::arg("show_electric") = true, py::arg("show_magnetic") = true);

    // ==========================================================================
    // Session
    // ==========================================================================

    py::class_<maxwell::Session>(m, "Session", "Simulator plus sources and settings")
        .def(py::init<const maxwell::SimulationSettings&, bool>(),
             py::arg("settings") = maxwell::SimulationSettings{},
             py::arg("reflective_boundary") = false)
        .def("step_sim", &maxwell::Session::step_sim, py::arg("dt"))
        .def("tick", &maxwell::Session::tick)
        .def("set_sources", [](maxwell::Session& s, std::vector<maxwell::PointSource> sources) {
            s.set_sources(std::vector<maxwell::SignalSource>(sources.begin(), sources.end()));
        }, py::arg("sources"))
        .def("sources", [](const maxwell::Session& s) {
            std::vector<maxwell::PointSource> out;
            for (const maxwell::SignalSource& src : s.sources()) {
                out.push_back(std::get<maxwell::PointSource>(src));
            }
            return out;
        })
        .def("add_source", [](maxwell::Session& s, const maxwell::PointSource& source) {
            s.add_source(source);
        }, py::arg("source"))
        .def("clear_sources", &maxwell::Session::clear_sources)
        .def("apply_settings", &maxwell::Session::apply_settings, py::arg("settings"))
        .def_property_readonly("settings", &maxwell::Session::settings)
        .def("load_map", &maxwell::Session::load_map, py::arg("map"))
        .def("to_map", &maxwell::Session::to_map)
        .def("reset_fields", &maxwell::Session::reset_fields)
        .def("reset_materials", &maxwell::Session::reset_materials)
        .def("draw_material", &maxwell::Session::draw_material, py::arg("type"), py::arg("info"))
        .def("inject_signal", &maxwell::Session::inject_signal, py::arg("info"), py::arg("dt"))
        .def("set_reflective_boundary", &maxwell::Session::set_reflective_boundary,
             py::arg("reflective"))
        .def_property_readonly("time", &maxwell::Session::time)
        .def_property_readonly("simulator",
            py::overload_cast<>(&maxwell::Session::simulator),
            py::return_value_policy::reference_internal);
}
