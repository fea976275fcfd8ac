#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "pixedit/errors.hpp"
#include "pixedit/filters.hpp"
#include "pixedit/histogram.hpp"
#include "pixedit/image_io.hpp"
#include "pixedit/raster.hpp"
#include "pixedit/session.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace pepy {

using pe::EditSession;
using pe::FilterKind;
using pe::FilterParameters;
using pe::ImageHistogram;
using pe::RasterBuffer;

// ------------------------------------------------------------
// numpy (H x W x 4, uint8, C-contiguous, BGRA) -> RasterBuffer（會複製）
// ------------------------------------------------------------
static RasterBuffer numpy_to_raster(const py::array& array) {
    py::buffer_info info = array.request();

    if (info.ndim != 3 || info.shape[2] != 4) {
        throw std::runtime_error("expected HxWx4 BGRA uint8 array");
    }
    if (info.itemsize != 1) {
        throw std::runtime_error("expected dtype=uint8");
    }

    const auto h = static_cast<std::uint32_t>(info.shape[0]);
    const auto w = static_cast<std::uint32_t>(info.shape[1]);

    // H x W x 4: strides = [W*4, 4, 1]
    if (!(info.strides[0] == static_cast<py::ssize_t>(w) * 4 &&
          info.strides[1] == 4 &&
          info.strides[2] == 1)) {
        throw std::runtime_error("expected C-contiguous array (HxWx4)");
    }

    const auto* ptr = static_cast<const std::uint8_t*>(info.ptr);
    const std::size_t n = static_cast<std::size_t>(h) * w * 4;
    return RasterBuffer(w, h, ptr, n);
}

// ------------------------------------------------------------
// 共享的不可變影像 -> 唯讀 numpy（零拷貝）
// capsule 持有 shared_ptr，numpy 活著影像就活著
// ------------------------------------------------------------
static py::array raster_to_numpy(std::shared_ptr<const RasterBuffer> raster) {
    if (!raster || raster->empty()) {
        throw std::runtime_error("Image is empty");
    }

    const py::ssize_t h = raster->height();
    const py::ssize_t w = raster->width();

    std::vector<py::ssize_t> shape   = {h, w, 4};
    std::vector<py::ssize_t> strides = {w * 4, 4, 1};

    const std::uint8_t* data = raster->data();
    auto* holder = new std::shared_ptr<const RasterBuffer>(std::move(raster));
    py::capsule base(holder, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<const RasterBuffer>*>(p);
    });

    py::array out(py::dtype::of<std::uint8_t>(), shape, strides, data, base);
    // 底層是 session 的歷史狀態，不能讓 Python 端改
    out.attr("setflags")(py::arg("write") = false);
    return out;
}

static py::array raster_to_numpy(RasterBuffer&& raster) {
    return raster_to_numpy(std::make_shared<RasterBuffer>(std::move(raster)));
}

static py::dict histogram_to_dict(const ImageHistogram& hist) {
    auto bins_to_list = [](const ImageHistogram::Bins& bins) {
        return std::vector<std::uint64_t>(bins.begin(), bins.end());
    };
    py::dict d;
    d["red"]       = bins_to_list(hist.red);
    d["green"]     = bins_to_list(hist.green);
    d["blue"]      = bins_to_list(hist.blue);
    d["max_value"] = hist.max_value;
    return d;
}

static py::object snapshot_histogram(const pe::RasterSnapshot& snap) {
    if (!snap.histogram) return py::none();
    return histogram_to_dict(*snap.histogram);
}

// ------------------------------------------------------------
// 文字參數 → enum
// ------------------------------------------------------------
static FilterKind parse_kind(const std::string& s) {
    try {
        return pe::parse_filter_kind(s);
    } catch (const std::invalid_argument&) {
        std::string names;
        for (FilterKind k : pe::available_filters()) {
            if (!names.empty()) names += ", ";
            names += pe::filter_name(k);
        }
        throw std::runtime_error("unknown filter '" + s + "' (try one of: " + names +
                                 ", brightness, contrast)");
    }
}

static FilterParameters make_params(double brightness, double contrast, int blur_radius) {
    FilterParameters p;
    p.brightness  = brightness;
    p.contrast    = contrast;
    p.blur_radius = blur_radius;
    return p;
}

} // namespace pepy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace pepy;

    m.doc() = "PixEdit core (BGRA filters + undo/redo edit session)";

    // 例外對應
    auto base_error = py::register_exception<pe::Error>(m, "PixEditError");
    py::register_exception<pe::InvalidDimensions>(m, "InvalidDimensions", base_error.ptr());
    py::register_exception<pe::HistoryEmpty>(m, "HistoryEmpty", base_error.ptr());
    py::register_exception<pe::NoCurrentImage>(m, "NoCurrentImage", base_error.ptr());
    py::register_exception<pe::NoOriginalImage>(m, "NoOriginalImage", base_error.ptr());
    py::register_exception<pe::SessionBusy>(m, "SessionBusy", base_error.ptr());
    py::register_exception<pe::ImageIOError>(m, "ImageIOError", base_error.ptr());

    // Image IO
    m.def("load_image",
          [](const std::string& path) { return raster_to_numpy(pe::load_image(path)); },
          py::arg("path"),
          "Load image as numpy.ndarray (uint8, HxWx4, BGRA).");

    m.def("save_image",
          [](const std::string& path, const py::array& img, int quality) {
              RasterBuffer raster = numpy_to_raster(img);
              pe::save_image(path, raster, quality);
          },
          py::arg("path"), py::arg("img"), py::arg("quality") = 95,
          "Save HxWx4 BGRA array (.png/.jpg/.bmp).");

    m.def("filters",
          []() {
              std::vector<std::string> names;
              for (FilterKind k : pe::available_filters()) names.emplace_back(pe::filter_name(k));
              return names;
          },
          "Filter names offered by the editor.");

    m.def("transform",
          [](const py::array& src,
             const std::string& kind,
             double brightness,
             double contrast,
             int blur_radius) {
              RasterBuffer in = numpy_to_raster(src);
              const FilterKind k = parse_kind(kind);
              const FilterParameters p = make_params(brightness, contrast, blur_radius);
              RasterBuffer out = [&] {
                  py::gil_scoped_release release;
                  return pe::transform(in, k, p);
              }();
              return raster_to_numpy(std::move(out));
          },
          py::arg("img"),
          py::arg("kind"),
          py::arg("brightness") = 0.0,
          py::arg("contrast") = 0.0,
          py::arg("blur_radius") = 3,
          "Apply one filter to an HxWx4 BGRA array and return a new array.");

    m.def("histogram",
          [](const py::array& src) {
              RasterBuffer in = numpy_to_raster(src);
              return histogram_to_dict(pe::compute_histogram(in));
          },
          py::arg("img"),
          "RGB histogram of an HxWx4 BGRA array.");

    // -------------------- EditSession --------------------
    py::class_<EditSession>(m, "Session")
        .def(py::init<>())
        .def("load",
             [](EditSession& s, const py::array& img) {
                 RasterBuffer raster = numpy_to_raster(img);
                 py::gil_scoped_release release;
                 s.load(std::move(raster));
             },
             py::arg("img"))
        .def("apply",
             [](EditSession& s, const std::string& kind,
                double brightness, double contrast, int blur_radius) {
                 const FilterKind k = parse_kind(kind);
                 const FilterParameters p = make_params(brightness, contrast, blur_radius);
                 pe::RasterSnapshot snap = [&] {
                     py::gil_scoped_release release;
                     return s.apply(k, p);
                 }();
                 return raster_to_numpy(snap.buffer);
             },
             py::arg("kind"),
             py::arg("brightness") = 0.0,
             py::arg("contrast") = 0.0,
             py::arg("blur_radius") = 3,
             "Apply a filter to the current image; returns the new current image.")
        .def("undo",
             [](EditSession& s) {
                 pe::RasterSnapshot snap = [&] {
                     py::gil_scoped_release release;
                     return s.undo();
                 }();
                 return raster_to_numpy(snap.buffer);
             })
        .def("redo",
             [](EditSession& s) {
                 pe::RasterSnapshot snap = [&] {
                     py::gil_scoped_release release;
                     return s.redo();
                 }();
                 return raster_to_numpy(snap.buffer);
             })
        .def("reset",
             [](EditSession& s) {
                 pe::RasterSnapshot snap = [&] {
                     py::gil_scoped_release release;
                     return s.reset();
                 }();
                 return raster_to_numpy(snap.buffer);
             })
        .def("mark_saved", &EditSession::mark_saved)
        .def_property_readonly("current",
             [](const EditSession& s) -> py::object {
                 auto cur = s.current();
                 if (!cur) return py::none();
                 return raster_to_numpy(std::move(cur));
             })
        .def_property_readonly("histogram",
             [](const EditSession& s) { return snapshot_histogram(s.snapshot()); })
        .def_property_readonly("can_undo", &EditSession::can_undo)
        .def_property_readonly("can_redo", &EditSession::can_redo)
        .def_property_readonly("dirty", &EditSession::dirty)
        .def_property_readonly("busy", &EditSession::busy)
        .def_property_readonly("undo_depth", &EditSession::undo_depth)
        .def_property_readonly("redo_depth", &EditSession::redo_depth);
}
