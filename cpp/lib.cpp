/*

Wascap-CPP - WebAssembly capability claims, signed and embedded in C++
Copyright (c) 2025 Albert Blasczykowski (Aless Microsystems)

This program is licensed under the Aless Microsystems Source-Available License (Non-Commercial, No Military) v1.0 Available in the Root
Directory of the project as LICENSE in Text Format.
You may use, copy, modify, and distribute this program for Non-Commercial purposes only, subject to the terms of that license.
Use by or for military, intelligence, or defense entities or purposes is strictly prohibited.

If you distribute this program in object form or make it available to others over a network, you must provide the complete
corresponding source code for the provided functionality under this same license.

This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the License for details.

You should have received a copy of the License along with this program; if not, see the LICENSE file included with this source.

*/

#include "global.h"

#include <exception>
#include <iterator>
#include <span>
#include <string>
#include <vector>
#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>
#include <nanobind/stl/optional.h>
#include "wascap.h"

namespace nb = nanobind;
using namespace nb::literals;

// Memory leak profiling
static bool leak_warnings_enabled = []()
{
    const char *env = std::getenv("WASCAP_CPP_LEAK_WARNINGS");
    return env && std::string(env) == "1";
}();

static std::span<const uint8_t> bytes_view(const nb::bytes &b)
{
    return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(b.c_str()), b.size());
}

static nb::bytes to_bytes(const std::vector<uint8_t> &v)
{
    return nb::bytes(reinterpret_cast<const char *>(v.data()), v.size());
}

static constexpr ErrorKind error_kinds[] = {
    ErrorKind::ParseError,
    ErrorKind::SerializationError,
    ErrorKind::EncodingError,
    ErrorKind::TokenDecodeError,
    ErrorKind::InvalidModuleHash,
    ErrorKind::SigningError,
    ErrorKind::IoError,
};

// Python subclass of WascapException for each ErrorKind, owned by the module
static PyObject *error_types[std::size(error_kinds)] = {};

// Raises the subclass for the error's kind with a `kind` attribute set
static void translate_wascap_exception(const std::exception_ptr &p, void *)
{
    try
    {
        std::rethrow_exception(p);
    }
    catch (const WascapException &e)
    {
        nb::handle type(error_types[static_cast<size_t>(e.kind())]);
        nb::object instance = type(e.what());
        instance.attr("kind") = nb::cast(e.kind());
        PyErr_SetObject(type.ptr(), instance.ptr());
    }
}

NB_MODULE(_wascap_impl, m)
{
    nb::set_leak_warnings(leak_warnings_enabled);

    nb::enum_<ErrorKind>(m, "ErrorKind")
        .value("ParseError", ErrorKind::ParseError)
        .value("SerializationError", ErrorKind::SerializationError)
        .value("EncodingError", ErrorKind::EncodingError)
        .value("TokenDecodeError", ErrorKind::TokenDecodeError)
        .value("InvalidModuleHash", ErrorKind::InvalidModuleHash)
        .value("SigningError", ErrorKind::SigningError)
        .value("IoError", ErrorKind::IoError);

    nb::exception<WascapException> base_error(m, "WascapException");
    for (ErrorKind kind : error_kinds)
    {
        std::string name = error_kind_name(kind);
        std::string qualified = "_wascap_impl." + name;
        PyObject *type = PyErr_NewException(qualified.c_str(), base_error.ptr(), nullptr);
        if (!type)
            throw nb::python_error();
        m.attr(name.c_str()) = nb::steal(type);
        error_types[static_cast<size_t>(kind)] = type;
    }
    // Registered after nb::exception so it is consulted first
    nb::register_exception_translator(translate_wascap_exception);

    nb::class_<KeyPair>(m, "KeyPair")
        .def_static("new_account", &KeyPair::new_account)
        .def_static("new_module", &KeyPair::new_module)
        .def_static("from_seed", &KeyPair::from_seed, "seed"_a)
        .def_static("from_public_key", &KeyPair::from_public_key, "public_key"_a)
        .def("public_key", &KeyPair::public_key)
        .def("seed", &KeyPair::seed)
        .def("can_sign", &KeyPair::can_sign)
        .def("sign", [](const KeyPair &self, nb::bytes message)
             { return to_bytes(self.sign(bytes_view(message))); })
        .def("verify", [](const KeyPair &self, nb::bytes message, nb::bytes signature)
             { return self.verify(bytes_view(message), bytes_view(signature)); });

    nb::class_<Claims>(m, "Claims")
        .def(nb::init<>())
        .def_static("with_dates", [](const std::string &issuer, const std::string &subject,
                                     std::optional<std::vector<std::string>> caps,
                                     std::optional<std::vector<std::string>> tags,
                                     std::optional<uint64_t> not_before,
                                     std::optional<uint64_t> expires)
                    { return Claims::with_dates(issuer, subject, std::move(caps), std::move(tags), not_before, expires); },
                    "issuer"_a, "subject"_a, "caps"_a = nb::none(), "tags"_a = nb::none(),
                    "not_before"_a = nb::none(), "expires"_a = nb::none())
        .def_rw("expires", &Claims::expires)
        .def_rw("id", &Claims::id)
        .def_rw("issued_at", &Claims::issued_at)
        .def_rw("issuer", &Claims::issuer)
        .def_rw("subject", &Claims::subject)
        .def_rw("not_before", &Claims::not_before)
        .def_rw("tags", &Claims::tags)
        .def_rw("caps", &Claims::caps)
        .def_rw("module_hash", &Claims::module_hash)
        .def("to_json", &claims_to_json_string)
        .def("__eq__", [](const Claims &self, const Claims &other)
             { return self == other; });

    nb::class_<Token>(m, "Token")
        .def_rw("jwt", &Token::jwt)
        .def_rw("claims", &Token::claims);

    nb::class_<TokenValidation>(m, "TokenValidation")
        .def_rw("expired", &TokenValidation::expired)
        .def_rw("expires_human", &TokenValidation::expires_human)
        .def_rw("not_before_human", &TokenValidation::not_before_human)
        .def_rw("cannot_use_yet", &TokenValidation::cannot_use_yet)
        .def_rw("signature_valid", &TokenValidation::signature_valid);

    m.def("extract_claims", [](nb::bytes contents)
          {
        std::optional<Token> token;
        {
            nb::gil_scoped_release release;
            token = extract_claims(bytes_view(contents));
        }
        return token; }, "contents"_a);
    m.def("embed_claims", [](nb::bytes orig, const Claims &claims, const KeyPair &kp)
          {
        std::vector<uint8_t> out;
        {
            nb::gil_scoped_release release;
            out = embed_claims(bytes_view(orig), claims, kp);
        }
        return to_bytes(out); }, "orig_bytecode"_a, "claims"_a, "kp"_a);
    m.def("sign_buffer_with_claims", [](nb::bytes buf, const KeyPair &mod_kp, const KeyPair &acct_kp,
                                         std::optional<uint64_t> expires_in_days,
                                         std::optional<uint64_t> not_before_days,
                                         std::vector<std::string> caps,
                                         std::vector<std::string> tags)
          { return to_bytes(sign_buffer_with_claims(bytes_view(buf), mod_kp, acct_kp, expires_in_days,
                                                    not_before_days, std::move(caps), std::move(tags))); },
          "buf"_a, "mod_kp"_a, "acct_kp"_a, "expires_in_days"_a = nb::none(), "not_before_days"_a = nb::none(),
          "caps"_a = std::vector<std::string>(), "tags"_a = std::vector<std::string>());
    m.def("validate_token", [](const std::string &jwt)
          { return validate_token(jwt); }, "jwt"_a);
    m.def("compute_module_hash", [](nb::bytes contents)
          { return compute_hash_without_jwt(WasmModule::parse(bytes_view(contents))); }, "contents"_a);
}
