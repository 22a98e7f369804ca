#include <pybind11/pybind11.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "tailf/follower.hpp"

namespace py = pybind11;

// ---------- helpers ----------
static std::unique_ptr<tailf::FollowingReader> make_follower(const std::string& path, bool poll,
                                                             int wait_ms, int idle_ms) {
    tailf::FollowOptions opt;
    opt.backend = poll ? tailf::Backend::Poll : tailf::Backend::Inotify;
    opt.wait_ms = wait_ms;
    opt.inactivity_timeout_ms = idle_ms;
    return std::make_unique<tailf::FollowingReader>(path, opt);
}

// b"" signals end-of-data, like a closed pipe
static py::bytes read_block(tailf::FollowingReader& r, std::size_t n) {
    std::vector<std::byte> buf(n);
    std::ptrdiff_t got;
    {
        py::gil_scoped_release nogil;
        got = r.read(buf);
    }
    if (got <= 0) return py::bytes();
    return py::bytes(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(got));
}

// ---------- module ----------
PYBIND11_MODULE(pytailf, m) {
    m.doc() = "Follow a growing file (tail -f) as a blocking byte stream";

    py::register_exception<tailf::InvalidTarget>(m, "InvalidTarget", PyExc_ValueError);

    py::class_<tailf::FollowingReader>(m, "Follower")
        .def(py::init(&make_follower),
             py::arg("path"), py::arg("poll") = false,
             py::arg("wait_ms") = 2000, py::arg("idle_ms") = 0)
        .def("start", &tailf::FollowingReader::start,
             py::call_guard<py::gil_scoped_release>())
        .def("read", [](tailf::FollowingReader& r, std::size_t n) {
            if (n == 0) return py::bytes();
            return read_block(r, n);
        }, py::arg("n") = 1024)
        .def("read_byte", [](tailf::FollowingReader& r) {
            py::gil_scoped_release nogil;
            return r.read();
        })
        .def("available", &tailf::FollowingReader::available)
        .def("close", &tailf::FollowingReader::close)
        .def_property_readonly("closed", &tailf::FollowingReader::closed)
        .def_property_readonly("path", [](const tailf::FollowingReader& r) { return r.path().string(); })
        .def("__enter__", [](tailf::FollowingReader& r) -> tailf::FollowingReader& { return r; },
             py::return_value_policy::reference)
        .def("__exit__", [](tailf::FollowingReader& r, py::object, py::object, py::object) {
            r.close();
            return false;
        })
        .def("__iter__", [](tailf::FollowingReader& r) -> tailf::FollowingReader& { return r; },
             py::return_value_policy::reference)
        .def("__next__", [](tailf::FollowingReader& r) {
            py::bytes b = read_block(r, 1024);
            if (py::len(b) == 0) throw py::stop_iteration();
            return b;
        });
}
