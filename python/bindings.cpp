#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "imgmgr/config.hpp"
#include "imgmgr/filename.hpp"
#include "imgmgr/geometry.hpp"
#include "imgmgr/image.hpp"
#include "imgmgr/image_manager.hpp"
#include "imgmgr/logging.hpp"
#include "imgmgr/pixel_ops.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace imgmgrpy {

using imgmgr::ImageU8;

// ------------------------------------------------------------
// 共用：檢查 numpy array (uint8, C-contiguous, HxW or HxWxC)
// ------------------------------------------------------------
struct ShapeInfo {
    int h;
    int w;
    int c;
};

static ShapeInfo check_uint8_hw_or_hwc(const py::buffer_info& info) {
    if (info.ndim != 2 && info.ndim != 3) {
        throw std::runtime_error("expected HxW or HxWxC uint8 array");
    }
    if (info.itemsize != 1) {
        throw std::runtime_error("expected dtype=uint8");
    }

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);
    const int c = (info.ndim == 3) ? static_cast<int>(info.shape[2]) : 1;

    if (!ImageU8::valid_channels(c)) {
        throw std::runtime_error("expected 1, 3 or 4 channels");
    }

    const bool contiguous = (info.ndim == 2)
        ? (info.strides[0] == static_cast<py::ssize_t>(w) && info.strides[1] == 1)
        : (info.strides[0] == static_cast<py::ssize_t>(w * c) &&
           info.strides[1] == static_cast<py::ssize_t>(c) &&
           info.strides[2] == 1);
    if (!contiguous) {
        throw std::runtime_error("expected C-contiguous array");
    }

    return {h, w, c};
}

// ------------------------------------------------------------
// numpy.ndarray -> ImageU8（零拷貝，只讀）
// ------------------------------------------------------------
static ImageU8 numpy_to_imageu8(const py::array& array) {
    py::buffer_info info = array.request();
    auto shape = check_uint8_hw_or_hwc(info);

    auto* ptr = static_cast<uint8_t*>(info.ptr);

    // 捕獲 owner，讓 numpy 陣列活得比 ImageU8 久
    py::object owner = array;
    std::shared_ptr<uint8_t[]> sp(ptr, [owner](uint8_t*) mutable {});

    return ImageU8(shape.h, shape.w, shape.c, std::move(sp));
}

// ------------------------------------------------------------
// ImageU8 -> numpy.ndarray（零拷貝）
// ------------------------------------------------------------
static py::array imageu8_to_numpy(const ImageU8& img) {
    if (img.empty()) {
        throw std::runtime_error("Image is empty");
    }

    const int h = img.h();
    const int w = img.w();
    const int c = img.c();

    std::vector<py::ssize_t> shape;
    std::vector<py::ssize_t> strides;
    if (c == 1) {
        shape   = {h, w};
        strides = {static_cast<py::ssize_t>(w), 1};
    } else {
        shape   = {h, w, c};
        strides = {static_cast<py::ssize_t>(w * c), static_cast<py::ssize_t>(c), 1};
    }

    auto* sp_copy = new std::shared_ptr<uint8_t[]>(img.shared());
    py::capsule base(sp_copy, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<uint8_t[]>*>(p);
    });

    return py::array(py::dtype::of<uint8_t>(), shape, strides, img.shared().get(), base);
}

// ------------------------------------------------------------
// 記憶體內轉換：和 ImageManager 同一套 geometry，但不經過檔案與快取
// ------------------------------------------------------------
static py::array transform_py(const py::array& src, int width, int height, const std::string& mode) {
    ImageU8 in = numpy_to_imageu8(src);
    const imgmgr::TransformSpec spec = imgmgr::compute_transform_spec(
        in.w(), in.h(), width, height, imgmgr::parse_mode(mode));

    ImageU8 out;
    {
        py::gil_scoped_release release;
        out = imgmgr::resize(in, spec.render_width, spec.render_height, true);
        if (spec.crop) out = imgmgr::crop(out, *spec.crop);
    }
    return imageu8_to_numpy(out);
}

static py::dict transform_spec_py(int orig_w, int orig_h, int width, int height, const std::string& mode) {
    const imgmgr::TransformSpec spec = imgmgr::compute_transform_spec(
        orig_w, orig_h, width, height, imgmgr::parse_mode(mode));

    py::dict d;
    d["render_width"]  = spec.render_width;
    d["render_height"] = spec.render_height;
    if (spec.crop) {
        py::dict crop;
        crop["x"]      = spec.crop->x;
        crop["y"]      = spec.crop->y;
        crop["width"]  = spec.crop->width;
        crop["height"] = spec.crop->height;
        d["crop"] = crop;
    } else {
        d["crop"] = py::none();
    }
    return d;
}

// config 檔（可選）+ 個別覆寫
static std::unique_ptr<imgmgr::ImageManager> make_manager(
    const std::optional<std::string>& config_path,
    const std::optional<std::string>& public_root,
    const std::optional<std::string>& error_image)
{
    imgmgr::Config cfg = config_path ? imgmgr::load_config_and_logging(*config_path) : imgmgr::Config{};
    if (public_root) cfg.public_root = *public_root;
    if (error_image) cfg.error_image = *error_image;
    return std::make_unique<imgmgr::ImageManager>(std::move(cfg));
}

} // namespace imgmgrpy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace imgmgrpy;

    m.doc() = "imgmgr core (cached image resize / crop derivatives)";

    py::class_<imgmgr::ImageManager>(m, "ImageManager")
        .def(py::init(&make_manager),
             py::arg("config_path") = py::none(),
             py::arg("public_root") = py::none(),
             py::arg("error_image") = py::none())
        .def("resolve",
             [](imgmgr::ImageManager& self,
                const std::string& path,
                int width,
                int height,
                const std::string& mode,
                std::optional<int> quality,
                std::optional<std::string> format) {
                 return self.resolve(path, width, height, mode, quality, std::move(format));
             },
             py::arg("path"),
             py::arg("width"),
             py::arg("height"),
             py::arg("mode") = "crop",
             py::arg("quality") = py::none(),
             py::arg("format") = py::none(),
             "Return the public path of the derivative, or None when even the error image failed.")
        .def("get_path",
             [](const imgmgr::ImageManager& self,
                const std::string& path,
                int width,
                int height,
                const std::string& mode,
                std::optional<std::string> format,
                bool from_root) {
                 imgmgr::TransformRequest req;
                 req.source_path   = path;
                 req.width         = width;
                 req.height        = height;
                 req.mode          = imgmgr::parse_mode(mode);
                 req.quality       = self.config().default_quality;
                 req.output_format = std::move(format);
                 return self.get_path(req, from_root);
             },
             py::arg("path"),
             py::arg("width"),
             py::arg("height"),
             py::arg("mode") = "crop",
             py::arg("format") = py::none(),
             py::arg("from_root") = false,
             "Derivative location without transforming (creates the directories).")
        .def("delete_image", &imgmgr::ImageManager::delete_image,
             py::arg("path"),
             "Delete the source and every derivative; returns the number of files removed.")
        .def("errors", &imgmgr::ImageManager::errors,
             "Errors collected by the last resolve (the list is cleared).");

    m.def("compute_transform_spec", &transform_spec_py,
          py::arg("orig_width"),
          py::arg("orig_height"),
          py::arg("width"),
          py::arg("height"),
          py::arg("mode") = "crop",
          "Render size and crop rectangle for a transform (no I/O).");

    m.def("transform", &transform_py,
          py::arg("img"),
          py::arg("width"),
          py::arg("height"),
          py::arg("mode") = "crop",
          "Resize / crop a uint8 numpy array (HxW, HxWx3 or HxWx4) in memory.");

    m.def("slug", &imgmgr::slug,
          py::arg("name"),
          "Normalize an upload filename.");

    m.def("init_logging",
          [](const std::string& level, const std::string& file) {
              imgmgr::LoggingConfig cfg;
              cfg.level = level;
              cfg.file  = file;
              return imgmgr::init_logging(cfg);
          },
          py::arg("level") = "info",
          py::arg("file") = "");
}
