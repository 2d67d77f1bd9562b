// pybind_module.cpp
//
// Python bindings for the position client.
// Exposes PosCli, returning decoded samples as Python dicts and mapping
// client errors onto Python exceptions.

#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

#include "pos_client.h"

namespace py = pybind11;


// PositionSample -> {"position": float, "timestamp_ns": int}
static py::dict sample_to_dict(const PositionSample &s) {
    py::dict d;
    d["position"] = py::float_(s.position);
    d["timestamp_ns"] = py::int_(s.timestamp_ns);
    return d;
}

static py::bytes frame_to_bytes(const uint8_t *data, size_t len) {
    return py::bytes(reinterpret_cast<const char *>(data), len);
}

PYBIND11_MODULE(pos_cli, m) {
    m.doc() = "Motor position client over the motor process's Unix domain socket";

    // Translators run newest first, so bases are registered before the classes derived from them.
    auto &pos_cli_error = py::register_exception<PosCliError>(m, "PosCliError", PyExc_RuntimeError);
    auto &connection_error = py::register_exception<ConnectionError>(m, "ConnectionError", PyExc_OSError);
    py::register_exception<ConnectionTimeout>(m, "ConnectionTimeout", connection_error.ptr());
    py::register_exception<ProtocolError>(m, "ProtocolError", pos_cli_error.ptr());

    m.attr("RESPONSE_FRAME_SIZE") = py::int_(kResponseFrameSize);
    m.attr("CMD_GETPOS") = py::int_(static_cast<int>(kCmdGetPos));

    py::class_<PosCli>(m, "PosCli")
        .def(py::init([](const std::optional<std::string> &socket_path,
                         const std::optional<int> &connect_timeout_ms,
                         const std::optional<int> &poll_initial_ms,
                         const std::optional<int> &poll_max_ms,
                         const std::optional<int> &response_timeout_ms,
                         const std::optional<int> &request_period_ms) {
            // 기본값은 PosCliConfig 에서
            PosCliConfig cfg;
            if (socket_path)         cfg.socket_path = *socket_path;
            if (connect_timeout_ms)  cfg.connect_timeout_ms = *connect_timeout_ms;
            if (poll_initial_ms)     cfg.poll_initial_ms = *poll_initial_ms;
            if (poll_max_ms)         cfg.poll_max_ms = *poll_max_ms;
            if (response_timeout_ms) cfg.response_timeout_ms = *response_timeout_ms;
            if (request_period_ms)   cfg.request_period_ms = *request_period_ms;
            return new PosCli(cfg);
        }),
        py::arg("socket_path") = std::nullopt,
        py::arg("connect_timeout_ms") = std::nullopt,
        py::arg("poll_initial_ms") = std::nullopt,
        py::arg("poll_max_ms") = std::nullopt,
        py::arg("response_timeout_ms") = std::nullopt,
        py::arg("request_period_ms") = std::nullopt)

        .def("connect", &PosCli::connect, py::call_guard<py::gil_scoped_release>())
        .def("close", &PosCli::close,
             "Release the socket. Raises PosCliError while run() is active on another thread; stop() it first.")
        .def("stop", &PosCli::stop)
        .def("is_connected", &PosCli::is_connected)

        .def("request_position", [](PosCli &self) {
            PositionSample s;
            {
                py::gil_scoped_release release;
                s = self.request_position();
            }
            return sample_to_dict(s); // dict
        })

        .def("request_position_frame", [](PosCli &self) {
            std::vector<uint8_t> frame;
            {
                py::gil_scoped_release release;
                frame = self.request_position_frame();
            }
            return frame_to_bytes(frame.data(), frame.size()); // bytes
        })

        .def("run", [](PosCli &self, const py::object &callback) {
            std::optional<py::function> cb;
            if (!callback.is_none()) cb = callback.cast<py::function>();

            // Ctrl-C is seen once per sample: the handler raises, the loop stops.
            py::gil_scoped_release release;
            self.run([&self, &cb](const PositionSample &s) {
                py::gil_scoped_acquire acquire;
                if (PyErr_CheckSignals() != 0) {
                    self.stop();
                    throw py::error_already_set();
                }
                if (cb) (*cb)(s.position, s.timestamp_ns);
            });
        }, py::arg("callback") = py::none(),
           "Poll until stop(). callback(position, timestamp_ns) is called for every sample.")

        .def_property_readonly("socket_path", [](const PosCli &self) {
            return self.config().socket_path;
        })
        .def_property_readonly("requests", &PosCli::requests)
        .def_property_readonly("protocol_errors", &PosCli::protocol_errors)
        .def_property_readonly("mean_round_trip_ms", [](const PosCli &self) {
            return self.round_trip().mean();
        })

        .def_static("build_request", [](int command) {
            if (command < 0 || command > 255) throw std::out_of_range("command out of range 0..255");
            auto req = PosCli::build_request(static_cast<uint8_t>(command));
            return frame_to_bytes(req.data(), req.size());
        }, py::arg("command") = static_cast<int>(kCmdGetPos))

        .def_static("decode_response", [](const py::bytes &frame) {
            std::string raw = frame;
            PositionSample s = PosCli::decode(reinterpret_cast<const uint8_t *>(raw.data()), raw.size());
            return sample_to_dict(s); // dict
        }, py::arg("frame"));
}
