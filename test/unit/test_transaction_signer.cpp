#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "anchor/transaction_signer.hpp"
#include "core/errors.hpp"
#include "util/hashing.hpp"
#include "util/keccak.hpp"

using namespace mediguard;
using anchor::LegacyTransaction;
using anchor::TransactionSigner;

namespace {

const std::string kKey = "0x4646464646464646464646464646464646464646464646464646464646464646";

std::string hexOf(const std::string &bytes)
{
    return util::hashing::toHex(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size());
}

// Transfer of 1 ether with nonce 9 on chain 1, as published with EIP-155.
LegacyTransaction eip155Example()
{
    LegacyTransaction tx;
    tx.nonce = 9;
    tx.gasPrice = 20000000000ULL;
    tx.gasLimit = 21000;
    tx.to = "0x3535353535353535353535353535353535353535";
    tx.value = 1000000000000000000ULL;
    tx.chainId = 1;
    return tx;
}

} // namespace

TEST(KeccakTest, KnownDigests) {
    EXPECT_EQ(util::hashing::keccak256Hex(""),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    EXPECT_EQ(util::hashing::keccak256Hex("abc"),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
    // Longer than one 136-byte block.
    EXPECT_EQ(util::hashing::keccak256Hex(std::string(200, 'a')),
              "96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

TEST(RlpTest, StringsAndIntegers) {
    EXPECT_EQ(hexOf(anchor::rlp::encodeUint(0)), "80");
    EXPECT_EQ(hexOf(anchor::rlp::encodeUint(15)), "0f");
    EXPECT_EQ(hexOf(anchor::rlp::encodeUint(1024)), "820400");
    EXPECT_EQ(anchor::rlp::encodeBytes("dog"), "\x83" "dog");
    EXPECT_EQ(hexOf(anchor::rlp::encodeBytes("")), "80");
    EXPECT_EQ(hexOf(anchor::rlp::encodeBigEndian(std::string("\0\0\x01", 3))), "01");
    EXPECT_EQ(hexOf(anchor::rlp::encodeBigEndian(std::string(3, '\0'))), "80");

    const std::string longText(56, 'x');
    const std::string encoded = anchor::rlp::encodeBytes(longText);
    ASSERT_EQ(encoded.size(), 58u);
    EXPECT_EQ(hexOf(encoded.substr(0, 2)), "b838");
}

TEST(RlpTest, Lists) {
    EXPECT_EQ(hexOf(anchor::rlp::encodeList({})), "c0");
    EXPECT_EQ(anchor::rlp::encodeList({anchor::rlp::encodeBytes("cat"), anchor::rlp::encodeBytes("dog")}),
              "\xc8\x83" "cat" "\x83" "dog");
}

TEST(DecodeHexTest, AcceptsPrefixAndRejectsJunk) {
    EXPECT_EQ(anchor::decodeHex("0x0aFF"), std::string("\x0a\xff", 2));
    EXPECT_EQ(anchor::decodeHex("0aff"), std::string("\x0a\xff", 2));
    EXPECT_TRUE(anchor::decodeHex("0x").empty());
    EXPECT_THROW(anchor::decodeHex("0xabc"), std::invalid_argument);
    EXPECT_THROW(anchor::decodeHex("zz"), std::invalid_argument);
}

TEST(TransactionSignerTest, AddressAndPublicKeyFromKey) {
    TransactionSigner signer(kKey);
    EXPECT_EQ(signer.Address(), "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");
    ASSERT_EQ(signer.PublicKey().size(), 65u);
    EXPECT_EQ(static_cast<unsigned char>(signer.PublicKey()[0]), 0x04);

    TransactionSigner unprefixed(kKey.substr(2));
    EXPECT_EQ(unprefixed.Address(), signer.Address());
}

TEST(TransactionSignerTest, SigningPayloadMatchesEip155Example) {
    EXPECT_EQ(hexOf(anchor::signingPayload(eip155Example())),
              "ec098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a764000080018080");
    EXPECT_EQ(util::hashing::keccak256Hex(anchor::signingPayload(eip155Example())),
              "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53");
}

TEST(TransactionSignerTest, SignsEip155ExampleExactly) {
    TransactionSigner signer(kKey);
    const anchor::SignedTransaction signedTx = signer.Sign(eip155Example());
    EXPECT_EQ(signedTx.rawHex,
              "0xf86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a7640000"
              "8025a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276"
              "a067cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
    EXPECT_EQ(signedTx.hash, "0x33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788");
}

TEST(TransactionSignerTest, SignatureIsDeterministicAndChainBound) {
    TransactionSigner signer(kKey);
    LegacyTransaction tx = eip155Example();
    tx.data = "MediGuardAI:anchor";
    const anchor::SignedTransaction first = signer.Sign(tx);
    EXPECT_EQ(signer.Sign(tx).rawHex, first.rawHex);

    tx.chainId = 11155111;
    EXPECT_NE(signer.Sign(tx).rawHex, first.rawHex);
}

TEST(TransactionSignerTest, MalformedTransactionsAreRefused) {
    TransactionSigner signer(kKey);

    LegacyTransaction noChain = eip155Example();
    noChain.chainId = 0;
    EXPECT_THROW(signer.Sign(noChain), core::AnchorServiceFailure);

    LegacyTransaction shortRecipient = eip155Example();
    shortRecipient.to = "0x3535";
    EXPECT_THROW(signer.Sign(shortRecipient), core::AnchorServiceFailure);

    LegacyTransaction junkRecipient = eip155Example();
    junkRecipient.to = "0xnotanaddressnotanaddressnotanaddressnot";
    EXPECT_THROW(signer.Sign(junkRecipient), core::AnchorServiceFailure);
}

TEST(TransactionSignerTest, BadKeysAreConfigurationErrors) {
    EXPECT_THROW(TransactionSigner(""), core::ConfigurationError);
    EXPECT_THROW(TransactionSigner("0x4646"), core::ConfigurationError);
    EXPECT_THROW(TransactionSigner("0x" + std::string(64, 'g')), core::ConfigurationError);
    EXPECT_THROW(TransactionSigner("0x" + std::string(64, '0')), core::ConfigurationError);
    // The secp256k1 group order itself is out of range.
    EXPECT_THROW(TransactionSigner("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"),
                 core::ConfigurationError);
}
