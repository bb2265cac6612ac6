/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host/mmr/runtime_interface.hpp"

#include <gtest/gtest.h>

#include "codec/scale/scale.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/host/mmr_extension_mock.hpp"
#include "testutil/outcome.hpp"

using subspace::Bytes;
using subspace::host::Externalities;
using subspace::host::mmr::EncodableOpaqueLeaf;
using subspace::host::mmr::getMmrLeafData;
using subspace::host::mmr::LeafData;
using subspace::host::mmr::MmrExtension;
using subspace::host::mmr::MmrExtensionMock;
using subspace::host::mmr::verifyMmrProof;
using testing::_;
using testing::Return;

class MmrRuntimeInterfaceTest : public ::testing::Test {
 public:
  void SetUp() override {
    externalities.registerExtension<MmrExtension>(extension);
  }

  std::shared_ptr<MmrExtensionMock> extension{
      std::make_shared<MmrExtensionMock>()};
  Externalities externalities;

  const subspace::common::Hash256 block_hash{
      "0101010101010101010101010101010101010101010101010101010101010101"_hash256};
  const LeafData leaf_data{
      "0202020202020202020202020202020202020202020202020202020202020202"_hash256,
      "0303030303030303030303030303030303030303030303030303030303030303"_hash256};
};

/**
 * @given registered extension knowing the block
 * @when getting leaf data
 * @then leaf data of extension is returned
 */
TEST_F(MmrRuntimeInterfaceTest, LeafData) {
  EXPECT_CALL(*extension, getMmrLeafData(block_hash))
      .WillOnce(Return(leaf_data));
  EXPECT_EQ(getMmrLeafData(externalities, block_hash), leaf_data);
}

/**
 * @given registered extension not knowing the block
 * @when getting leaf data
 * @then none is returned
 */
TEST_F(MmrRuntimeInterfaceTest, LeafDataUnknown) {
  EXPECT_CALL(*extension, getMmrLeafData(_)).WillOnce(Return(boost::none));
  EXPECT_FALSE(getMmrLeafData(externalities, block_hash));
}

/**
 * @given leaves and proof
 * @when verifying proof
 * @then leaves and proof are passed to extension as is
 */
TEST_F(MmrRuntimeInterfaceTest, VerifyProof) {
  const std::vector<EncodableOpaqueLeaf> leaves{{1, 2}, {3}};
  const Bytes proof{4, 5, 6};
  EXPECT_CALL(*extension, verifyMmrProof(leaves, proof))
      .WillOnce(Return(true));
  EXPECT_CALL(*extension, verifyMmrProof(leaves, Bytes{}))
      .WillOnce(Return(false));
  EXPECT_TRUE(verifyMmrProof(externalities, leaves, proof));
  EXPECT_FALSE(verifyMmrProof(externalities, leaves, Bytes{}));
}

/**
 * @given leaf data
 * @when encoding it
 * @then state root is followed by extrinsics root
 */
TEST_F(MmrRuntimeInterfaceTest, LeafDataScale) {
  EXPECT_OUTCOME_TRUE(encoded, subspace::codec::scale::encode(leaf_data));
  ASSERT_EQ(encoded.size(), 64);
  EXPECT_EQ(encoded[0], 2);
  EXPECT_EQ(encoded[32], 3);
  EXPECT_OUTCOME_EQ(subspace::codec::scale::decode<LeafData>(encoded),
                    leaf_data);
}

/**
 * @given externalities without mmr extension
 * @when calling mmr functions
 * @then process is aborted
 */
TEST(MmrRuntimeInterfaceDeathTest, MissingExtension) {
  Externalities externalities;
  EXPECT_DEATH(getMmrLeafData(externalities, {}), "");
  EXPECT_DEATH(verifyMmrProof(externalities, {}, {}), "");
}
