#include "geodb/core.hpp"
#include "geodb/database.hpp"
#include "geodb/error.hpp"
#include "geodb/log.hpp"
#include "geodb/options.hpp"
#include <nanobind/nanobind.h>
#include <nanobind/stl/filesystem.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

NB_MODULE(geodb, m) {
  m.doc() = "geodb: libGeoIP City database bindings";

  // --- Core Utils ---
  m.def("version", &geodb::core::version, "Get the library version");
  m.def("native_version", &geodb::core::native_version,
        "Get the linked libGeoIP version");

  nb::class_<geodb::core::BuildInfo>(m, "BuildInfo")
      .def_ro("compiler", &geodb::core::BuildInfo::compiler)
      .def_ro("architecture", &geodb::core::BuildInfo::architecture)
      .def_ro("standard", &geodb::core::BuildInfo::standard)
      .def_ro("native_library", &geodb::core::BuildInfo::native_library)
      .def_ro("charset", &geodb::core::BuildInfo::charset)
      .def_ro("default_flags", &geodb::core::BuildInfo::default_flags)
      .def("__repr__", [](const geodb::core::BuildInfo &b) {
        return "<BuildInfo arch='" + b.architecture + "' compiler='" +
               b.compiler + "' " + b.native_library + " flags=" +
               std::to_string(b.default_flags) + ">";
      });

  m.def("get_build_info", &geodb::core::get_build_info,
        "Get build environment details");

  m.def(
      "set_log_level",
      [](const std::string &level) {
        auto parsed = geodb::log::parse_level(level);
        if (!parsed)
          throw std::invalid_argument("unknown log level '" + level + "'");
        geodb::log::set_level(*parsed);
      },
      "level"_a, "Set the geodb log level ('trace' ... 'off')");

  // --- Errors ---
  nb::exception<geodb::OpenError>(m, "OpenError", PyExc_OSError);

  // --- Options ---
  nb::enum_<geodb::CachingStrategy>(m, "CachingStrategy")
      .value("STANDARD", geodb::CachingStrategy::Standard,
             "No caching, read the file on every lookup")
      .value("MEMORY_CACHE", geodb::CachingStrategy::MemoryCache,
             "Load the whole database into memory")
      .value("INDEX_CACHE", geodb::CachingStrategy::IndexCache,
             "Cache the most recently used index");

  nb::class_<geodb::Options>(m, "Options")
      .def(
          "__init__",
          [](geodb::Options *self, geodb::CachingStrategy caching,
             bool reload_on_update, bool use_mmap) {
            new (self) geodb::Options{caching, reload_on_update, use_mmap};
          },
          "caching"_a = geodb::CachingStrategy::Standard,
          "reload_on_update"_a = true, "use_mmap"_a = true)
      .def_ro("caching", &geodb::Options::caching)
      .def_ro("reload_on_update", &geodb::Options::reload_on_update)
      .def_ro("use_mmap", &geodb::Options::use_mmap)
      .def_prop_ro("bitmask",
                   [](const geodb::Options &o) { return geodb::bitmask(o); },
                   "The GeoIP_open() flag bitmask for these options");

  // --- Record (read-only value) ---
  nb::class_<geodb::Record>(m, "Record")
      .def_ro("country_code", &geodb::Record::country_code)
      .def_ro("country_code3", &geodb::Record::country_code3)
      .def_ro("country_name", &geodb::Record::country_name)
      .def_ro("region", &geodb::Record::region)
      .def_ro("city", &geodb::Record::city)
      .def_ro("postal_code", &geodb::Record::postal_code)
      .def_ro("latitude", &geodb::Record::latitude)
      .def_ro("longitude", &geodb::Record::longitude)
      .def_ro("area_code", &geodb::Record::area_code)
      .def_ro("continent_code", &geodb::Record::continent_code)
      .def("__eq__", [](const geodb::Record &a, const geodb::Record &b) {
        return a == b;
      })
      .def("__repr__", [](const geodb::Record &r) {
        return "<Record " + r.country_code + " '" + r.city + "'>";
      });

  // --- Database ---
  // The wrapped geodb::Database is destroyed when Python collects the
  // object; its destructor performs the same idempotent close() as the
  // explicit call, so a collected-but-closed object never double-frees.
  nb::class_<geodb::Database>(m, "Database")
      .def(
          "__init__",
          [](geodb::Database *self, const std::filesystem::path &path,
             std::optional<geodb::Options> options) {
            new (self) geodb::Database(geodb::Database::open(
                path, options.value_or(geodb::default_options())));
          },
          "path"_a, "options"_a = nb::none(),
          "Open a GeoIP database. Raises OpenError on failure.")
      .def("lookup", &geodb::Database::lookup, "ip"_a,
           "Record for the address, or None if the database has no entry")
      .def("close", &geodb::Database::close,
           "Release the native handle (idempotent)")
      .def_prop_ro("closed",
                   [](const geodb::Database &self) { return !self.is_open(); })
      .def_prop_ro("path", &geodb::Database::path)
      .def("info", &geodb::Database::info, "Database description string")
      .def("edition", &geodb::Database::edition,
           "libGeoIP database type id (-1 once closed)")
      .def("__enter__", [](nb::object self) -> nb::object { return self; })
      .def("__exit__",
           [](geodb::Database &self, nb::args) { self.close(); });
}
