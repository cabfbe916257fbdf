// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <ethkit/abi/abi_decode.hpp>
#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_json.hpp>
#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/abi/fmt/abi_type_fmt.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/fmt/address_fmt.hpp>
#include <ethkit/core/fmt/bytes_fmt.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/log.hpp>
#include <ethkit/core/log_level_map.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/private_key_signer.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/fmt/signature_fmt.hpp>
#include <ethkit/transaction/fmt/transaction_fmt.hpp>
#include <ethkit/transaction/rlp/transaction_rlp.hpp>
#include <ethkit/transaction/transaction.hpp>
#include <ethkit/transaction/transaction_signer.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

using namespace ethkit;
using json = nlohmann::json;

namespace
{
    template <class T>
    T unwrap(Result<T> res, char const *const what)
    {
        if (res.has_error()) {
            throw std::runtime_error(
                fmt::format("{}: {}", what, res.error().message().c_str()));
        }
        return std::move(res).value();
    }

    byte_string parse_hex(std::string const &s, char const *const what)
    {
        auto const bytes = evmc::from_hex(s);
        if (!bytes.has_value()) {
            throw std::invalid_argument(fmt::format("{}: invalid hex", what));
        }
        return *bytes;
    }

    Address parse_address(std::string const &s)
    {
        auto const address = evmc::from_hex<Address>(s);
        if (!address.has_value()) {
            throw std::invalid_argument(
                fmt::format("invalid address '{}'", s));
        }
        return *address;
    }

    bytes32_t parse_bytes32(std::string const &s)
    {
        auto const b = evmc::from_hex<bytes32_t>(s);
        if (!b.has_value()) {
            throw std::invalid_argument(fmt::format("invalid hash '{}'", s));
        }
        return *b;
    }

    // JSON-RPC quantities: 0x hex or decimal strings, or JSON numbers
    uint256_t parse_quantity(json const &j)
    {
        if (j.is_number_unsigned()) {
            return j.get<uint64_t>();
        }
        return intx::from_string<uint256_t>(j.get<std::string>());
    }

    uint64_t parse_u64(json const &j)
    {
        auto const v = parse_quantity(j);
        if (v > std::numeric_limits<uint64_t>::max()) {
            throw std::out_of_range("quantity exceeds 64 bits");
        }
        return static_cast<uint64_t>(v);
    }

    template <class T, class F>
    std::optional<T> field(json const &j, char const *const key, F &&parse)
    {
        auto const it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        return parse(*it);
    }

    AccessList parse_access_list(json const &j)
    {
        AccessList list;
        for (auto const &entry : j) {
            AccessEntry e{
                .a = parse_address(entry.at("address").get<std::string>())};
            for (auto const &key : entry.at("storageKeys")) {
                e.keys.push_back(parse_bytes32(key.get<std::string>()));
            }
            list.push_back(std::move(e));
        }
        return list;
    }

    Authorization parse_authorization(json const &j)
    {
        Authorization auth{
            .chain_id = parse_quantity(j.at("chainId")),
            .address = parse_address(j.at("address").get<std::string>()),
            .nonce = parse_u64(j.at("nonce"))};
        if (j.contains("r")) {
            auth.signature = Signature{
                .r = parse_quantity(j.at("r")),
                .s = parse_quantity(j.at("s")),
                .y_parity = static_cast<uint8_t>(parse_u64(j.at("yParity")))};
        }
        return auth;
    }

    TransactionRequest parse_transaction_request(json const &j)
    {
        auto const quantity = [](json const &v) { return parse_quantity(v); };
        auto const u64 = [](json const &v) { return parse_u64(v); };

        TransactionRequest req;
        req.type = field<uint8_t>(j, "type", [](json const &v) {
            return static_cast<uint8_t>(parse_u64(v));
        });
        req.chain_id = field<uint256_t>(j, "chainId", quantity);
        req.nonce = field<uint64_t>(j, "nonce", u64);
        req.to = field<Address>(j, "to", [](json const &v) {
            return parse_address(v.get<std::string>());
        });
        req.value = field<uint256_t>(j, "value", quantity);
        req.data = field<byte_string>(j, "data", [](json const &v) {
            return parse_hex(v.get<std::string>(), "data");
        });
        req.gas_limit = field<uint64_t>(j, "gas", u64);
        req.gas_price = field<uint256_t>(j, "gasPrice", quantity);
        req.max_fee_per_gas = field<uint256_t>(j, "maxFeePerGas", quantity);
        req.max_priority_fee_per_gas =
            field<uint256_t>(j, "maxPriorityFeePerGas", quantity);
        req.access_list =
            field<AccessList>(j, "accessList", &parse_access_list);
        req.max_fee_per_blob_gas =
            field<uint256_t>(j, "maxFeePerBlobGas", quantity);
        req.blob_versioned_hashes = field<std::vector<bytes32_t>>(
            j, "blobVersionedHashes", [](json const &v) {
                std::vector<bytes32_t> hashes;
                for (auto const &h : v) {
                    hashes.push_back(parse_bytes32(h.get<std::string>()));
                }
                return hashes;
            });
        req.authorization_list = field<AuthorizationList>(
            j, "authorizationList", [](json const &v) {
                AuthorizationList list;
                for (auto const &a : v) {
                    list.push_back(parse_authorization(a));
                }
                return list;
            });
        return req;
    }

    std::string quantity_to_hex(uint256_t const &v)
    {
        return "0x" + intx::hex(v);
    }

    json to_json(Authorization const &auth)
    {
        json j{
            {"chainId", quantity_to_hex(auth.chain_id)},
            {"address", "0x" + evmc::hex(auth.address)},
            {"nonce", quantity_to_hex(auth.nonce)}};
        if (auth.signature.has_value()) {
            j["yParity"] = quantity_to_hex(auth.signature->y_parity);
            j["r"] = quantity_to_hex(auth.signature->r);
            j["s"] = quantity_to_hex(auth.signature->s);
        }
        return j;
    }

    json to_json(AccessList const &list)
    {
        json j = json::array();
        for (auto const &entry : list) {
            json keys = json::array();
            for (auto const &key : entry.keys) {
                keys.push_back("0x" + evmc::hex(key));
            }
            j.push_back(
                {{"address", "0x" + evmc::hex(entry.a)},
                 {"storageKeys", std::move(keys)}});
        }
        return j;
    }

    json to_json(SignedTransaction const &signed_txn)
    {
        json j;
        j["type"] = quantity_to_hex(
            static_cast<uint8_t>(get_type(signed_txn.transaction)));
        std::visit(
            [&j](auto const &t) {
                if (auto const chain_id = std::optional<uint256_t>{t.chain_id};
                    chain_id.has_value()) {
                    j["chainId"] = quantity_to_hex(*chain_id);
                }
                j["nonce"] = quantity_to_hex(t.nonce);
                j["gas"] = quantity_to_hex(t.gas_limit);
                if (auto const to = std::optional<Address>{t.to};
                    to.has_value()) {
                    j["to"] = "0x" + evmc::hex(*to);
                }
                j["value"] = quantity_to_hex(t.value);
                j["data"] = "0x" + evmc::hex(t.data);
                using T = std::decay_t<decltype(t)>;
                if constexpr (requires { t.gas_price; }) {
                    j["gasPrice"] = quantity_to_hex(t.gas_price);
                }
                if constexpr (requires { t.max_fee_per_gas; }) {
                    j["maxFeePerGas"] = quantity_to_hex(t.max_fee_per_gas);
                    j["maxPriorityFeePerGas"] =
                        quantity_to_hex(t.max_priority_fee_per_gas);
                }
                if constexpr (!std::is_same_v<T, LegacyTransaction>) {
                    j["accessList"] = to_json(t.access_list);
                }
                if constexpr (std::is_same_v<T, Eip4844Transaction>) {
                    j["maxFeePerBlobGas"] =
                        quantity_to_hex(t.max_fee_per_blob_gas);
                    json hashes = json::array();
                    for (auto const &h : t.blob_versioned_hashes) {
                        hashes.push_back("0x" + evmc::hex(h));
                    }
                    j["blobVersionedHashes"] = std::move(hashes);
                }
                if constexpr (std::is_same_v<T, Eip7702Transaction>) {
                    json list = json::array();
                    for (auto const &auth : t.authorization_list) {
                        list.push_back(to_json(auth));
                    }
                    j["authorizationList"] = std::move(list);
                }
            },
            signed_txn.transaction);
        j["v"] = quantity_to_hex(get_v(signed_txn.sc));
        j["r"] = quantity_to_hex(signed_txn.sc.r);
        j["s"] = quantity_to_hex(signed_txn.sc.s);
        return j;
    }

    // "(uint256,string)" or "f(uint256,string)"
    AbiType parse_tuple_or_signature(
        std::string const &s, std::optional<uint32_t> &selector,
        Hasher const &hasher)
    {
        if (!s.starts_with('(')) {
            auto const sig = unwrap(parse_signature(s), "signature");
            selector = abi_selector(hasher, sig.name, sig.inputs);
            return unwrap(AbiType::tuple(sig.inputs), "signature");
        }
        auto type = unwrap(parse_abi_type(s), "types");
        if (type.kind() != AbiType::Kind::Tuple) {
            throw std::invalid_argument("expected a parenthesised type list");
        }
        return type;
    }

    PrivateKeySigner load_key(std::string const &key)
    {
        return unwrap(PrivateKeySigner::create(parse_bytes32(key)), "key");
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"ethkit"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    auto log_level = quill::LogLevel::Warning;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    std::string signature;
    auto *const selector_cmd =
        cli.add_subcommand("selector", "4 byte function selector");
    selector_cmd->add_option("signature", signature, "function signature")
        ->required();

    auto *const topic_cmd = cli.add_subcommand("topic", "event topic 0");
    topic_cmd->add_option("signature", signature, "event signature")
        ->required();

    std::string values;
    auto *const encode_cmd =
        cli.add_subcommand("encode", "abi encode call data or a type list");
    encode_cmd
        ->add_option(
            "signature",
            signature,
            "function signature, or a parenthesised type list")
        ->required();
    encode_cmd->add_option("values", values, "JSON array of arguments")
        ->required();
    bool packed = false;
    encode_cmd->add_flag("--packed", packed, "non-standard packed mode");

    std::string data;
    auto *const decode_cmd =
        cli.add_subcommand("decode", "abi decode a parenthesised type list");
    decode_cmd->add_option("types", signature, "e.g. (uint256,string)")
        ->required();
    decode_cmd->add_option("data", data, "hex encoded data")->required();

    std::string key;
    std::string tx;
    auto *const sign_tx_cmd =
        cli.add_subcommand("sign-tx", "sign a JSON transaction request");
    sign_tx_cmd->add_option("--key", key, "hex private key")->required();
    sign_tx_cmd->add_option("--tx", tx, "JSON transaction request")
        ->required();

    auto *const decode_tx_cmd =
        cli.add_subcommand("decode-tx", "decode a signed envelope");
    decode_tx_cmd->add_option("data", data, "hex encoded envelope")
        ->required();

    std::string chain_id = "0";
    std::string address;
    uint64_t nonce = 0;
    bool rlp_preimage = false;
    auto *const sign_auth_cmd = cli.add_subcommand(
        "sign-authorization", "sign an EIP-7702 authorization");
    sign_auth_cmd->add_option("--key", key, "hex private key")->required();
    sign_auth_cmd->add_option("--chain_id", chain_id, "0 for any chain");
    sign_auth_cmd->add_option("--address", address, "delegate address")
        ->required();
    sign_auth_cmd->add_option("--nonce", nonce, "authority nonce");
    sign_auth_cmd->add_flag(
        "--rlp", rlp_preimage, "sign 0x05 || rlp([chain_id, address, nonce])");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    init_logging(log_level);

    KeccakHasher const hasher;
    try {
        if (*selector_cmd) {
            auto const sig = unwrap(parse_signature(signature), "signature");
            std::cout << fmt::format(
                             "0x{:08x}",
                             abi_selector(hasher, sig.name, sig.inputs))
                      << '\n';
        }
        else if (*topic_cmd) {
            auto const sig = unwrap(parse_signature(signature), "signature");
            std::cout << "0x"
                      << evmc::hex(abi_topic(hasher, sig.name, sig.inputs))
                      << '\n';
        }
        else if (*encode_cmd) {
            std::optional<uint32_t> selector;
            auto const tuple =
                parse_tuple_or_signature(signature, selector, hasher);
            LOG_DEBUG("encoding {}", tuple);
            auto const args = unwrap(
                abi_value_from_json(tuple, json::parse(values)), "values");
            auto const &list = std::get<AbiValueList>(args.value);
            auto const types = tuple.components();
            auto const body =
                packed ? unwrap(abi_encode_packed(types, list), "encode")
                       : unwrap(abi_encode(types, list), "encode");
            byte_string out;
            if (selector.has_value() && !packed) {
                out += to_byte_string_view(selector_bytes(*selector));
            }
            out += body;
            std::cout << "0x" << evmc::hex(out) << '\n';
        }
        else if (*decode_cmd) {
            std::optional<uint32_t> selector;
            auto const tuple =
                parse_tuple_or_signature(signature, selector, hasher);
            auto const bytes = parse_hex(data, "data");
            auto const decoded =
                unwrap(abi_decode_value(tuple, bytes), "decode");
            std::cout << abi_value_to_json(tuple, decoded).dump(2) << '\n';
        }
        else if (*sign_tx_cmd) {
            auto signer = load_key(key);
            auto const req = parse_transaction_request(json::parse(tx));
            auto const signed_txn =
                unwrap(sign_transaction(req, hasher, signer), "sign");
            auto const raw =
                unwrap(rlp::encode_transaction(signed_txn), "encode");
            json out{
                {"raw", "0x" + evmc::hex(raw)},
                {"hash", "0x" + evmc::hex(hasher.keccak256(raw))},
                {"from", "0x" + evmc::hex(signer.address())},
                {"transaction", to_json(signed_txn)}};
            std::cout << out.dump(2) << '\n';
        }
        else if (*decode_tx_cmd) {
            auto const raw = parse_hex(data, "data");
            auto const signed_txn = unwrap(decode_transaction(raw), "decode");
            LOG_DEBUG(
                "decoded {} transaction {}",
                get_type(signed_txn.transaction),
                signed_txn.sc);
            json out{
                {"hash", "0x" + evmc::hex(hasher.keccak256(raw))},
                {"transaction", to_json(signed_txn)}};
            auto const sender = recover_sender(hasher, signed_txn);
            if (sender.has_value()) {
                out["from"] = "0x" + evmc::hex(sender.value());
            }
            else {
                LOG_WARNING(
                    "sender recovery failed: {}",
                    sender.error().message().c_str());
            }
            std::cout << out.dump(2) << '\n';
        }
        else if (*sign_auth_cmd) {
            auto signer = load_key(key);
            Authorization const auth{
                .chain_id = intx::from_string<uint256_t>(chain_id),
                .address = parse_address(address),
                .nonce = nonce};
            auto const signed_auth = unwrap(
                sign_authorization(
                    auth,
                    hasher,
                    signer,
                    rlp_preimage ? AuthorizationPreimage::rlp
                                 : AuthorizationPreimage::packed),
                "sign");
            std::cout << to_json(signed_auth).dump(2) << '\n';
        }
    }
    catch (std::exception const &e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
