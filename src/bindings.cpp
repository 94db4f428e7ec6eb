/**
 * @file bindings.cpp
 * @brief Python bindings for the entropy coders module.
 */

#include "codec_errors.hpp"
#include "entropy_codec.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

PYBIND11_MODULE(entropy_coders, m) {
  m.doc() = "Canonical Huffman and range coding of integer symbol sequences";

  // Errors surface as Python exceptions; the subclasses derive from CodecError.
  auto codec_error = py::register_exception<CodecError>(m, "CodecError");
  py::register_exception<EmptyAlphabetError>(m, "EmptyAlphabetError", codec_error.ptr());
  py::register_exception<UnknownSymbolError>(m, "UnknownSymbolError", codec_error.ptr());
  py::register_exception<CorruptStreamError>(m, "CorruptStreamError", codec_error.ptr());
  py::register_exception<OutOfDataError>(m, "OutOfDataError", codec_error.ptr());
  py::register_exception<PrecisionOverflowError>(m, "PrecisionOverflowError",
                                                 codec_error.ptr());

  py::enum_<CoderMethod>(m, "CoderMethod")
      .value("HUFFMAN", CoderMethod::HUFFMAN)
      .value("RANGE_STATIC", CoderMethod::RANGE_STATIC)
      .value("RANGE_ADAPTIVE", CoderMethod::RANGE_ADAPTIVE);

  py::class_<CodecConfig>(m, "CodecConfig")
      .def(py::init<>())
      .def_readwrite("method", &CodecConfig::method)
      .def_readwrite("alphabet_size", &CodecConfig::alphabet_size)
      .def_readwrite("max_symbols", &CodecConfig::max_symbols);

  py::class_<EntropyCodec>(m, "EntropyCodec")
      .def(py::init<CodecConfig>(), py::arg("config") = CodecConfig())
      .def(py::init([](CoderMethod method, uint32_t alphabet_size) {
             CodecConfig config;
             config.method = method;
             config.alphabet_size = alphabet_size;
             return EntropyCodec(config);
           }),
           py::arg("method"), py::arg("alphabet_size") = 0)

      // --- ENCODE ---
      // Return 'py::bytes' rather than a list of ints
      .def(
          "encode",
          [](const EntropyCodec &self, const std::vector<uint32_t> &symbols) {
            std::vector<uint8_t> out = self.encode(symbols);
            return py::bytes(reinterpret_cast<const char *>(out.data()), out.size());
          },
          "Encode a sequence of symbols into a self-describing byte stream.\n",
          py::arg("symbols"))

      // --- DECODE ---
      // We use a lambda to accept 'py::bytes' and convert it to
      // 'std::vector<uint8_t>'
      .def(
          "decode",
          [](const EntropyCodec &self, py::bytes data) {
            std::string s = data;
            std::vector<uint8_t> vec(s.begin(), s.end());
            return self.decode(vec);
          },
          "Decode a byte stream produced by encode() back to symbols.\n",
          py::arg("data"))

      .def_property_readonly("config", &EntropyCodec::config);
}
