#include <catch2/catch.hpp>

#include "quarry/tx_validator.h"
#include "test_helpers.h"

// Start Test Suite: transaction validator tests

TEST_CASE("tx validator  valid spend  reports fee", "[tx validator tests]") {
  ChainFixture chain(2);
  TxValidator validator(chain.settings);
  Transaction tx = PayBack(*chain.key, chain.blocks[1], 1234, chain.settings);

  REQUIRE(validator.CheckTransaction(tx) == Error::kOk);
  TxCheck check = validator.ValidateTransaction(tx, chain.ledger, 3, false);
  REQUIRE(check.IsValid());
  REQUIRE(check.fee == 1234);
}

TEST_CASE("tx validator  empty inputs or outputs  rejected", "[tx validator tests]") {
  Settings settings = TestSettings();
  TxValidator validator(settings);
  auto key = NewKey();

  Transaction noInputs;
  noInputs.vout.push_back(NewTXOutput(1, key->PubKeyHash()));
  noInputs.UpdateId();
  REQUIRE(validator.CheckTransaction(noInputs) == Error::kEmptyInputs);

  Transaction noOutputs = MakeSpend(*key, {Outpoint{Bytes(32, 1), 0}}, {});
  REQUIRE(validator.CheckTransaction(noOutputs) == Error::kEmptyOutputs);
}

TEST_CASE("tx validator  duplicate input  rejected", "[tx validator tests]") {
  Settings settings = TestSettings();
  TxValidator validator(settings);
  auto key = NewKey();
  Outpoint op{Bytes(32, 1), 0};
  Transaction tx = MakeSpend(*key, {op, op}, {NewTXOutput(1, key->PubKeyHash())});
  REQUIRE(validator.CheckTransaction(tx) == Error::kDuplicateInput);
}

TEST_CASE("tx validator  oversized  rejected", "[tx validator tests]") {
  Settings settings = TestSettings();
  settings.maxTxBytes = 200;
  TxValidator validator(settings);
  auto key = NewKey();
  Transaction tx = MakeSpend(*key, {Outpoint{Bytes(32, 1), 0}}, {NewTXOutput(1, key->PubKeyHash())});
  REQUIRE(validator.CheckTransaction(tx) == Error::kTxTooLarge);
}

TEST_CASE("tx validator  garbage signature  rejected statelessly", "[tx validator tests]") {
  Settings settings = TestSettings();
  TxValidator validator(settings);
  auto key = NewKey();
  Transaction tx = MakeSpend(*key, {Outpoint{Bytes(32, 1), 0}}, {NewTXOutput(1, key->PubKeyHash())});
  tx.vin[0].signature = Bytes{0x30, 0x01, 0x00};
  REQUIRE(validator.CheckTransaction(tx) == Error::kBadSignatureFormat);
}

TEST_CASE("tx validator  negative output  rejected", "[tx validator tests]") {
  Settings settings = TestSettings();
  TxValidator validator(settings);
  auto key = NewKey();
  Transaction tx = MakeSpend(*key, {Outpoint{Bytes(32, 1), 0}}, {NewTXOutput(-1, key->PubKeyHash())});
  REQUIRE(validator.CheckTransaction(tx) == Error::kNegativeOutput);
}

TEST_CASE("tx validator  missing outpoint", "[tx validator tests]") {
  ChainFixture chain(1);
  TxValidator validator(chain.settings);
  Transaction tx = MakeSpend(*chain.key, {Outpoint{Bytes(32, 7), 0}},
                             {NewTXOutput(1, chain.key->PubKeyHash())});
  TxCheck check = validator.ValidateTransaction(tx, chain.ledger, 2, false);
  REQUIRE(check.status == TxStatus::kInvalid);
  REQUIRE(check.error == Error::kMissingOutpoint);
}

TEST_CASE("tx validator  someone else's output  bad signature", "[tx validator tests]") {
  ChainFixture chain(1);
  TxValidator validator(chain.settings);
  auto thief = NewKey();
  Transaction tx = MakeSpend(*thief, {CoinbaseOutpoint(chain.blocks[1])},
                             {NewTXOutput(1, thief->PubKeyHash())});
  TxCheck check = validator.ValidateTransaction(tx, chain.ledger, 2, false);
  REQUIRE(check.error == Error::kBadSignature);
}

TEST_CASE("tx validator  tampered output after signing  bad signature", "[tx validator tests]") {
  ChainFixture chain(1);
  TxValidator validator(chain.settings);
  Transaction tx = PayBack(*chain.key, chain.blocks[1], 100, chain.settings);
  tx.vout[0].value -= 1;
  tx.UpdateId();
  REQUIRE(validator.ValidateTransaction(tx, chain.ledger, 2, false).error ==
          Error::kBadSignature);
}

TEST_CASE("tx validator  outputs exceed inputs", "[tx validator tests]") {
  ChainFixture chain(1);
  TxValidator validator(chain.settings);
  Transaction tx = PayBack(*chain.key, chain.blocks[1], -1, chain.settings);
  REQUIRE(validator.ValidateTransaction(tx, chain.ledger, 2, false).error ==
          Error::kInsufficientInputs);
}

TEST_CASE("tx validator  immature coinbase", "[tx validator tests]") {
  Settings settings = TestSettings();
  settings.coinbaseMaturity = 5;
  ChainFixture chain(2, settings);
  TxValidator validator(chain.settings);
  Transaction tx = PayBack(*chain.key, chain.blocks[1], 100, chain.settings);
  REQUIRE(validator.ValidateTransaction(tx, chain.ledger, 3, false).error ==
          Error::kImmatureCoinbase);
  REQUIRE(validator.ValidateTransaction(tx, chain.ledger, 6, false).IsValid());
}

TEST_CASE("tx validator  lock height", "[tx validator tests]") {
  ChainFixture chain(1);
  TxValidator validator(chain.settings);
  Amount subsidy = BlockSubsidy(chain.settings, 1);
  Transaction lock = MakeSpend(*chain.key, {CoinbaseOutpoint(chain.blocks[1])},
                               {NewTXOutput(subsidy - 100, chain.key->PubKeyHash(), 10)});
  chain.Extend({lock}, 100);

  Transaction spend = MakeSpend(*chain.key, {Outpoint{lock.id, 0}},
                                {NewTXOutput(subsidy - 200, chain.key->PubKeyHash())});
  REQUIRE(validator.ValidateTransaction(spend, chain.ledger, 3, false).error ==
          Error::kLockedOutput);
  REQUIRE(validator.ValidateTransaction(spend, chain.ledger, 10, false).IsValid());
}

TEST_CASE("tx validator  account nonce  sequencing", "[tx validator tests]") {
  ChainFixture chain(2);
  TxValidator validator(chain.settings);
  Amount subsidy = BlockSubsidy(chain.settings, 1);
  Bytes pkh = chain.key->PubKeyHash();
  auto spend = [&](uint64_t nonce) {
    return MakeAccountSpend(*chain.key, nonce, {CoinbaseOutpoint(chain.blocks[1])},
                            {NewTXOutput(subsidy - 100, pkh)});
  };

  REQUIRE(validator.ValidateTransaction(spend(0), chain.ledger, 3, false).IsValid());

  TxCheck ahead = validator.ValidateTransaction(spend(2), chain.ledger, 3, true);
  REQUIRE(ahead.status == TxStatus::kFutureNonce);
  REQUIRE(validator.ValidateTransaction(spend(2), chain.ledger, 3, false).error ==
          Error::kNonceGap);

  uint64_t beyond = chain.settings.futureNonceWindow + 1;
  REQUIRE(validator.ValidateTransaction(spend(beyond), chain.ledger, 3, true).error ==
          Error::kNonceGap);

  chain.Extend({spend(0)}, 100);
  Transaction again = MakeAccountSpend(*chain.key, 0, {CoinbaseOutpoint(chain.blocks[2])},
                                       {NewTXOutput(subsidy - 100, pkh)});
  REQUIRE(validator.ValidateTransaction(again, chain.ledger, 4, false).error ==
          Error::kNonceReused);
}

TEST_CASE("tx validator  account inputs from another key  sender mismatch",
          "[tx validator tests]") {
  Settings settings = TestSettings();
  TxValidator validator(settings);
  auto key = NewKey();
  auto other = NewKey();
  Transaction tx = MakeAccountSpend(*key, 0, {Outpoint{Bytes(32, 1), 0}},
                                    {NewTXOutput(1, key->PubKeyHash())});
  tx.kind = AccountTransfer{other->PubKeyHash(), 0};
  tx.UpdateId();
  REQUIRE(validator.CheckTransaction(tx) == Error::kSenderMismatch);
}

TEST_CASE("tx validator  coinbase outside a block  rejected", "[tx validator tests]") {
  ChainFixture chain(1);
  TxValidator validator(chain.settings);
  Transaction coinbase = NewCoinbaseTX(chain.key->PubKeyHash(), 1, 2, "");
  REQUIRE(validator.ValidateTransaction(coinbase, chain.ledger, 2, false).error ==
          Error::kUnexpectedCoinbase);
}
