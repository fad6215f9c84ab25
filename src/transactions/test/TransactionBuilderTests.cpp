// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "main/Config.h"
#include "test/Catch2.h"
#include "test/TestAccounts.h"
#include "test/test.h"
#include "transactions/Account.h"
#include "transactions/NetworkUtils.h"
#include "transactions/SignatureUtils.h"
#include "transactions/SignedTransaction.h"
#include "transactions/TransactionBuilder.h"
#include "transactions/TransactionUtils.h"
#include "transactions/TxBuildError.h"
#include "util/XDROperators.h"

#include <algorithm>

using namespace txbuild;
using namespace txbuild::txtest;
using Catch::Matchers::Contains;

namespace
{

Payment
paymentTo(std::string const& destination, int64_t amount = 100000000)
{
    return Payment{destination, TxAsset::native(), amount};
}
}

TEST_CASE("build assembles the transaction body", "[tx][builder]")
{
    auto const& key = keypair0();
    SimpleAccount account(key.getStrKeyPublic(), 9605939170639897);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.addOperation(CreateAccount{NEW_ACCOUNT_ADDRESS, 100000000})
        .addOperation(paymentTo(keypair2().getStrKeyPublic()))
        .setTimebounds(Timebounds::fixed(100, 200));

    auto built = builder.build();
    auto const& tx = built.getTransaction();

    REQUIRE(toAddress(tx.sourceAccount) == key.getStrKeyPublic());
    REQUIRE(tx.seqNum == 9605939170639898);
    REQUIRE(account.getSequenceNumber() == 9605939170639898);
    REQUIRE(tx.operations.size() == 2);
    REQUIRE(tx.operations[0].body.type() == CREATE_ACCOUNT);
    REQUIRE(tx.operations[1].body.type() == PAYMENT);
    REQUIRE(tx.fee == 200);
    REQUIRE(tx.memo.type() == MEMO_NONE);
    REQUIRE(bool(tx.timeBounds));
    REQUIRE(tx.timeBounds->minTime == 100);
    REQUIRE(tx.timeBounds->maxTime == 200);

    SECTION("each build consumes a sequence number")
    {
        REQUIRE(builder.build().getTransaction().seqNum == 9605939170639899);
        REQUIRE(account.getSequenceNumber() == 9605939170639899);
    }
}

TEST_CASE("build fee", "[tx][builder][fee]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 1);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.withoutTimebounds();
    for (int i = 0; i < 3; ++i)
    {
        builder.addOperation(Inflation{});
    }

    SECTION("defaults to base fee per operation")
    {
        REQUIRE(builder.build().getTransaction().fee == 300);
    }

    SECTION("explicit fee is used verbatim")
    {
        builder.setFee(1234);
        REQUIRE(builder.build().getTransaction().fee == 1234);
    }

    SECTION("explicit fee of zero restores the default")
    {
        builder.setFee(1234).setFee(0);
        REQUIRE(builder.build().getTransaction().fee == 300);
    }

    SECTION("custom base fee")
    {
        TransactionBuilder custom(account,
                                  NetworkUtils::TEST_NETWORK_PASSPHRASE,
                                  FeePolicy(250));
        custom.addOperation(Inflation{}).withoutTimebounds();
        REQUIRE(custom.build().getTransaction().fee == 250);
    }
}

TEST_CASE("build timebounds choice", "[tx][builder][timebounds]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.addOperation(Inflation{});

    SECTION("no choice made")
    {
        REQUIRE_THROWS_AS(builder.build(), ConfigError);
        REQUIRE_THROWS_WITH(builder.build(),
                            Contains("timebounds must be set"));
        REQUIRE(account.getSequenceNumber() == 10);
    }

    SECTION("default constructed timebounds")
    {
        builder.setTimebounds(Timebounds());
        REQUIRE_THROWS_WITH(
            builder.build(),
            "timebounds must be constructed using fixed(), timeout(), or "
            "noTimeout()");
        REQUIRE(account.getSequenceNumber() == 10);
    }

    SECTION("malformed window")
    {
        builder.setTimebounds(Timebounds::fixed(300, 200));
        REQUIRE_THROWS_AS(builder.build(), ValidationError);
    }

    SECTION("without timebounds")
    {
        builder.withoutTimebounds();
        REQUIRE(!bool(builder.build().getTransaction().timeBounds));
    }

    SECTION("explicit unbounded window is attached")
    {
        builder.setTimebounds(Timebounds::noTimeout(0));
        auto tx = builder.build().getTransaction();
        REQUIRE(bool(tx.timeBounds));
        REQUIRE(tx.timeBounds->minTime == 0);
        REQUIRE(tx.timeBounds->maxTime == 0);
    }

    SECTION("setting timebounds after declining them")
    {
        builder.withoutTimebounds().setTimebounds(Timebounds::fixed(1, 2));
        REQUIRE(bool(builder.build().getTransaction().timeBounds));
    }
}

TEST_CASE("build rejects malformed transactions", "[tx][builder]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.withoutTimebounds();

    SECTION("no operations")
    {
        REQUIRE_THROWS_AS(builder.build(), ValidationError);
        REQUIRE(account.getSequenceNumber() == 10);
    }

    SECTION("too many operations")
    {
        for (size_t i = 0; i <= MAX_OPERATIONS; ++i)
        {
            builder.addOperation(Inflation{});
        }
        REQUIRE_THROWS_AS(builder.build(), ValidationError);
        REQUIRE(account.getSequenceNumber() == 10);
    }

    SECTION("exactly the maximum number of operations")
    {
        for (size_t i = 0; i < MAX_OPERATIONS; ++i)
        {
            builder.addOperation(Inflation{});
        }
        REQUIRE(builder.build().getTransaction().operations.size() ==
                MAX_OPERATIONS);
    }

    SECTION("invalid memo")
    {
        builder.addOperation(Inflation{}).setMemo(
            TxMemo::text("this memo text is definitely too long"));
        REQUIRE_THROWS_AS(builder.build(), EncodingError);
    }

    SECTION("invalid source account")
    {
        SimpleAccount bad("GBAD", 10);
        TransactionBuilder badBuilder(bad,
                                      NetworkUtils::TEST_NETWORK_PASSPHRASE);
        badBuilder.addOperation(Inflation{}).withoutTimebounds();
        REQUIRE_THROWS_AS(badBuilder.build(), EncodingError);
        REQUIRE(bad.getSequenceNumber() == 10);
    }

    SECTION("exhausted sequence number")
    {
        SimpleAccount last(keypair0().getStrKeyPublic(), INT64_MAX);
        TransactionBuilder lastBuilder(last,
                                       NetworkUtils::TEST_NETWORK_PASSPHRASE);
        lastBuilder.addOperation(Inflation{}).withoutTimebounds();
        REQUIRE_THROWS_AS(lastBuilder.build(), SequenceError);
    }
}

TEST_CASE("operation errors name the failing operation", "[tx][builder]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.withoutTimebounds().addOperation(Inflation{});

    SECTION("payment without asset")
    {
        builder.addOperation(
            Payment{keypair2().getStrKeyPublic(), std::nullopt, 10});
        REQUIRE_THROWS_AS(builder.build(), ValidationError);
        REQUIRE_THROWS_WITH(
            builder.build(),
            "failed to build operation #1 (PAYMENT): asset required");
    }

    SECTION("bad destination address")
    {
        builder.addOperation(paymentTo("GABC"));
        REQUIRE_THROWS_AS(builder.build(), EncodingError);
        REQUIRE_THROWS_WITH(builder.build(),
                            Contains("failed to build operation #1 "
                                     "(PAYMENT): invalid destination"));
    }

    SECTION("native trustline")
    {
        builder.addOperation(ChangeTrust{TxAsset::native(), 10});
        REQUIRE_THROWS_WITH(builder.build(),
                            "failed to build operation #1 (CHANGE_TRUST): "
                            "trustline can't be changed for the native "
                            "asset");
    }

    SECTION("home domain too long")
    {
        SetOptions op;
        op.homeDomain = "LovelyLumensLookLuminousLovelyLumensLookLuminous.com";
        builder.addOperation(op);
        REQUIRE_THROWS_AS(builder.build(), ValidationError);
        REQUIRE_THROWS_WITH(builder.build(),
                            Contains("operation #1 (SET_OPTIONS)"));
    }

    SECTION("a failed build leaves the builder usable")
    {
        builder.addOperation(ChangeTrust{TxAsset::native(), 10});
        REQUIRE_THROWS(builder.build());

        TransactionBuilder fixed(account,
                                 NetworkUtils::TEST_NETWORK_PASSPHRASE);
        fixed.withoutTimebounds();
        for (auto const& op : builder.getOperations())
        {
            if (getOperationType(op) != CHANGE_TRUST)
            {
                fixed.addOperation(op);
            }
        }
        auto seq = account.getSequenceNumber();
        REQUIRE(fixed.build().getTransaction().seqNum == seq + 1);
    }
}

TEST_CASE("operation source account", "[tx][builder]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    Inflation withSource;
    withSource.sourceAccount = keypair1().getStrKeyPublic();
    builder.withoutTimebounds().addOperation(Inflation{}).addOperation(
        withSource);

    auto tx = builder.build().getTransaction();
    REQUIRE(!bool(tx.operations[0].sourceAccount));
    REQUIRE(bool(tx.operations[1].sourceAccount));
    REQUIRE(*tx.operations[1].sourceAccount ==
            keypair1().getPublicKey());
}

TEST_CASE("transaction hash depends on the network", "[tx][builder][hash]")
{
    auto build = [](std::string const& passphrase) {
        SimpleAccount account(keypair0().getStrKeyPublic(), 10);
        TransactionBuilder builder(account, passphrase);
        builder.addOperation(Inflation{}).withoutTimebounds();
        return builder.build();
    };

    auto testTx = build(NetworkUtils::TEST_NETWORK_PASSPHRASE);
    auto publicTx = build(NetworkUtils::PUBLIC_NETWORK_PASSPHRASE);

    REQUIRE(testTx.getTransaction() == publicTx.getTransaction());
    REQUIRE(testTx.hash() != publicTx.hash());
    REQUIRE(testTx.hash() ==
            NetworkUtils::transactionHash(
                NetworkUtils::networkID(NetworkUtils::TEST_NETWORK_PASSPHRASE),
                testTx.getTransaction()));
    REQUIRE(testTx.hash() == build(NetworkUtils::TEST_NETWORK_PASSPHRASE).hash());
}

TEST_CASE("empty network passphrase", "[tx][builder]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    REQUIRE_THROWS_AS(TransactionBuilder(account, ""), ConfigError);
    REQUIRE_THROWS_AS(NetworkUtils::networkID(""), ConfigError);

    SECTION("envelope decoded without a network")
    {
        TransactionBuilder builder(account,
                                   NetworkUtils::TEST_NETWORK_PASSPHRASE);
        builder.addOperation(Inflation{}).withoutTimebounds();
        auto text = builder.build().sign(keypair0()).toBase64();
        auto decoded = SignedTransaction::fromBase64("", text);
        REQUIRE_THROWS_AS(decoded.hash(), ConfigError);
    }
}

TEST_CASE("signing", "[tx][builder][sign]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.addOperation(Inflation{}).withoutTimebounds();
    auto built = builder.build();

    SECTION("unsigned envelope")
    {
        auto env = built.toEnvelope();
        REQUIRE(env.getSignatureCount() == 0);
        REQUIRE(env.getTransaction() == built.getTransaction());
        REQUIRE(env.hash() == built.hash());
    }

    SECTION("signatures keep their order")
    {
        auto signedTx = built.sign(keypair0())
                            .sign(keypair1())
                            .sign(keypair2());
        auto const& sigs = signedTx.getEnvelope().signatures;
        REQUIRE(sigs.size() == 3);
        REQUIRE(SignatureUtils::doesHintMatch(
            keypair0().getPublicKey().ed25519(), sigs[0].hint));
        REQUIRE(SignatureUtils::doesHintMatch(
            keypair1().getPublicKey().ed25519(), sigs[1].hint));
        REQUIRE(SignatureUtils::doesHintMatch(
            keypair2().getPublicKey().ed25519(), sigs[2].hint));
        REQUIRE(signedTx.hasValidSignatureFrom(keypair0().getPublicKey()));
        REQUIRE(signedTx.hasValidSignatureFrom(keypair2().getPublicKey()));
        REQUIRE(!signedTx.hasValidSignatureFrom(
            SecretKey::random().getPublicKey()));
    }

    SECTION("signing does not modify the original")
    {
        auto once = built.sign(keypair0());
        auto twice = once.sign(keypair1());
        REQUIRE(once.getSignatureCount() == 1);
        REQUIRE(twice.getSignatureCount() == 2);
    }

    SECTION("signatures are deterministic")
    {
        REQUIRE(built.sign(keypair0()) == built.sign(keypair0()));
    }

    SECTION("signature computed elsewhere")
    {
        auto sig = SignatureUtils::sign(keypair1(), built.hash());
        auto signedTx = built.toEnvelope().addSignature(sig);
        REQUIRE(signedTx == built.sign(keypair1()));
    }

    SECTION("at most 20 signatures")
    {
        auto signedTx = built.toEnvelope();
        for (size_t i = 0; i < SignedTransaction::MAX_SIGNATURES; ++i)
        {
            signedTx = signedTx.sign(keypair0());
        }
        REQUIRE(signedTx.getSignatureCount() ==
                SignedTransaction::MAX_SIGNATURES);
        REQUIRE_THROWS_AS(signedTx.sign(keypair1()), ValidationError);
        REQUIRE(signedTx.getSignatureCount() ==
                SignedTransaction::MAX_SIGNATURES);
    }
}

TEST_CASE("envelope export", "[tx][builder][encode]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);
    builder.addOperation(Inflation{})
        .setMemo(TxMemo::text("round trip"))
        .setTimebounds(Timebounds::fixed(5, 10));
    auto signedTx = builder.build().sign(keypair0()).sign(keypair1());

    SECTION("base64 decodes to the same envelope")
    {
        auto decoded = SignedTransaction::fromBase64(
            NetworkUtils::TEST_NETWORK_PASSPHRASE, signedTx.toBase64());
        REQUIRE(decoded == signedTx);
        REQUIRE(decoded.toBinary() == signedTx.toBinary());
    }

    SECTION("unsigned envelope encodes an empty signature list")
    {
        auto bin = builder.build().toEnvelope().toBinary();
        REQUIRE(bin.size() >= 4);
        REQUIRE(std::all_of(bin.end() - 4, bin.end(),
                            [](uint8_t b) { return b == 0; }));
    }

    SECTION("malformed base64")
    {
        REQUIRE_THROWS_AS(
            SignedTransaction::fromBase64(
                NetworkUtils::TEST_NETWORK_PASSPHRASE, "not base64!"),
            EncodingError);
    }

    SECTION("truncated envelope")
    {
        auto bin = signedTx.toBinary();
        bin.resize(bin.size() - 10);
        REQUIRE_THROWS_AS(
            SignedTransaction::fromBinary(
                NetworkUtils::TEST_NETWORK_PASSPHRASE, bin),
            EncodingError);
    }
}

TEST_CASE("buildSignEncode", "[tx][builder]")
{
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);
    TransactionBuilder builder(account, NetworkUtils::TEST_NETWORK_PASSPHRASE);

    SECTION("success")
    {
        builder.addOperation(Inflation{}).withoutTimebounds();
        auto encoded = buildSignEncode(builder, keypair0());
        auto decoded = SignedTransaction::fromBase64(
            NetworkUtils::TEST_NETWORK_PASSPHRASE, encoded);
        REQUIRE(decoded.getSignatureCount() == 1);
        REQUIRE(decoded.hasValidSignatureFrom(keypair0().getPublicKey()));
        REQUIRE(decoded.getTransaction().seqNum == 11);
    }

    SECTION("build failure keeps its category")
    {
        builder.addOperation(Inflation{});
        REQUIRE_THROWS_AS(buildSignEncode(builder, keypair0()), ConfigError);
        REQUIRE_THROWS_WITH(
            buildSignEncode(builder, keypair0()),
            Contains("couldn't build transaction: timebounds must be set"));
    }

    SECTION("operation failure is prefixed twice")
    {
        builder.withoutTimebounds().addOperation(
            Payment{keypair2().getStrKeyPublic(), std::nullopt, 10});
        REQUIRE_THROWS_WITH(buildSignEncode(builder, keypair0()),
                            "couldn't build transaction: failed to build "
                            "operation #0 (PAYMENT): asset required");
    }
}

TEST_CASE("builder from config", "[tx][builder][config]")
{
    Config cfg = getTestConfig();
    cfg.BASE_FEE = 150;
    SimpleAccount account(keypair0().getStrKeyPublic(), 10);

    SECTION("network and fee")
    {
        auto builder = TransactionBuilder::fromConfig(account, cfg);
        REQUIRE(builder.getNetworkPassphrase() == cfg.NETWORK_PASSPHRASE);
        builder.addOperation(Inflation{}).withoutTimebounds();
        REQUIRE(builder.build().getTransaction().fee == 150);
    }

    SECTION("no default timeout leaves the choice to the caller")
    {
        cfg.DEFAULT_TIMEOUT = 0;
        auto builder = TransactionBuilder::fromConfig(account, cfg);
        builder.addOperation(Inflation{});
        REQUIRE_THROWS_AS(builder.build(), ConfigError);
    }

    SECTION("default timeout")
    {
        cfg.DEFAULT_TIMEOUT = 300;
        auto builder = TransactionBuilder::fromConfig(account, cfg);
        builder.addOperation(Inflation{});
        auto tx = builder.build().getTransaction();
        REQUIRE(bool(tx.timeBounds));
        REQUIRE(tx.timeBounds->minTime == 0);
        REQUIRE(tx.timeBounds->maxTime > 300);
    }
}
