#include "lib/tokenizer.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

PYBIND11_MODULE(bpe_cpp, m) {
    m.doc() = "Python bindings for the C++ BPE tokenizer";

    m.attr("GPT4_SPLIT_PATTERN") = bpe::GPT4_SPLIT_PATTERN;

    // Bind Tokenizer struct
    py::class_<bpe::Tokenizer>(m, "Tokenizer")
        .def(py::init<>())
        .def_readonly("pattern", &bpe::Tokenizer::pattern)
        .def("is_regex", &bpe::Tokenizer::is_regex)
        .def("merges",
             [](const bpe::Tokenizer &tok) { return tok.merges.pairs(); },
             "Learned merges in order; merge k has id 256 + k")
        .def("vocab_size",
             [](const bpe::Tokenizer &tok) { return tok.vocab.size(); })
        .def(
            "token_bytes",
            [](const bpe::Tokenizer &tok, bpe::TokenId id) {
                if (id >= tok.vocab.size()) {
                    throw py::index_error("token id out of range");
                }
                return py::bytes(tok.vocab[id]);
            },
            py::arg("id"));

    m.def("make_basic", &bpe::make_basic, "Tokenizer over the raw byte stream");
    m.def("make_regex", &bpe::make_regex,
          py::arg("pattern") = std::string(bpe::GPT4_SPLIT_PATTERN),
          "Tokenizer that splits text with `pattern` before merging");

    // Bind training function
    m.def("train", &bpe::train,
          py::arg("tokenizer"),
          py::arg("text"),
          py::arg("vocab_size"),
          py::arg("verbose") = false,
          "Train the tokenizer on the given text");

    // Bind save/load functions
    m.def("save", &bpe::save,
          py::arg("tokenizer"),
          py::arg("file_prefix"),
          "Write <file_prefix>.model and <file_prefix>.vocab");

    m.def("load", &bpe::load,
          py::arg("model_file"),
          "Load a tokenizer from a .model file");

    // Bind encode function
    m.def("encode", &bpe::encode,
          py::arg("text"),
          py::arg("tokenizer"),
          "Encode text into token IDs");

    m.def("decode", &bpe::decode,
          py::arg("tokens"),
          py::arg("tokenizer"),
          "Decode token IDs back into text");

    m.def("visualize", &bpe::visualize,
          py::arg("tokens"),
          py::arg("tokenizer"),
          "Visualize tokens with boundaries");
}
