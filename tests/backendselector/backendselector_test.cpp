/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "genie/backendselector.hpp"

#include "genie/test/log.hpp"

#include "mocks/clusterclientmock.hpp"
#include "mocks/rankingmock.hpp"

using namespace testing;
using namespace genie;
using namespace genie::backendselector;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class BackendSelectorTest : public Test {
protected:
    void SetUp() override
    {
        genie::test::InitLog();

        mCtx.mIdentity.mNamespace   = "default";
        mCtx.mIdentity.mName        = "nginx";
        mCtx.mIdentity.mContainerID = "container-1";
        mCtx.mMetadataAvailable     = true;
        mCtx.mRanking               = &mRanking;
        mCtx.mCluster               = &mCluster;
    }

    StrictMock<ranking::RankingClientMock>       mRanking;
    StrictMock<clusterclient::ClusterClientMock> mCluster;
    SelectionContext                             mCtx;
    BackendSelector                              mSelector;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(BackendSelectorTest, CNIAnnotation)
{
    mCtx.mAnnotations[cCNIAnnotation]      = "bridge, macvlan,,weave";
    mCtx.mAnnotations[cNetworksAnnotation] = "net1";

    SelectionResult result;

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());

    EXPECT_EQ(result.mSelections,
        std::vector<BackendSelection>({{"bridge", "", ""}, {"macvlan", "", ""}, {"", "", ""}, {"weave", "", ""}}));
    EXPECT_TRUE(result.mAnnotationUpdates.empty());
}

TEST_F(BackendSelectorTest, NetworksAnnotationList)
{
    mCtx.mAnnotations[cCNIAnnotation]      = "  ";
    mCtx.mAnnotations[cNetworksAnnotation] = "net-a, net-b";

    EXPECT_CALL(mCluster, GetLogicalNetwork("default", "net-a", _))
        .WillOnce(DoAll(SetArgReferee<2>(clusterclient::LogicalNetwork {"net-a", "bridge", "10.10.1.0/24"}),
            Return(ErrorEnum::eNone)));
    EXPECT_CALL(mCluster, GetLogicalNetwork("default", "net-b", _))
        .WillOnce(DoAll(SetArgReferee<2>(clusterclient::LogicalNetwork {"net-b", "macvlan", ""}),
            Return(ErrorEnum::eNone)));

    SelectionResult result;

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());

    EXPECT_EQ(result.mSelections,
        std::vector<BackendSelection>({{"bridge", "", "10.10.1.0/24"}, {"macvlan", "", ""}}));
}

TEST_F(BackendSelectorTest, NetworksAnnotationStructured)
{
    mCtx.mAnnotations[cNetworksAnnotation]
        = R"([{"name": "net-a", "interface": "eth5", "subnet": "192.168.0.0/24"}, {"name": "net-b"}])";

    EXPECT_CALL(mCluster, GetLogicalNetwork("default", "net-a", _))
        .WillOnce(DoAll(SetArgReferee<2>(clusterclient::LogicalNetwork {"net-a", "bridge", "10.10.1.0/24"}),
            Return(ErrorEnum::eNone)));
    EXPECT_CALL(mCluster, GetLogicalNetwork("default", "net-b", _))
        .WillOnce(DoAll(SetArgReferee<2>(clusterclient::LogicalNetwork {"net-b", "sriov", "10.30.5.0/24"}),
            Return(ErrorEnum::eNone)));

    SelectionResult result;

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());

    EXPECT_EQ(result.mSelections,
        std::vector<BackendSelection>({{"bridge", "eth5", "192.168.0.0/24"}, {"sriov", "", "10.30.5.0/24"}}));
}

TEST_F(BackendSelectorTest, NetworksWithoutNamespace)
{
    mCtx.mIdentity.mNamespace.clear();
    mCtx.mIdentity.mName.clear();
    mCtx.mAnnotations[cNetworksAnnotation] = "net-a";

    EXPECT_CALL(mCluster, GetLogicalNetwork("default", "net-a", _))
        .WillOnce(DoAll(SetArgReferee<2>(clusterclient::LogicalNetwork {"net-a", "macvlan", "10.20.1.0/24"}),
            Return(ErrorEnum::eNone)));

    SelectionResult result;

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());

    EXPECT_EQ(result.mSelections, std::vector<BackendSelection>({{"macvlan", "", "10.20.1.0/24"}}));
}

TEST_F(BackendSelectorTest, NetworksLookupFailure)
{
    mCtx.mAnnotations[cNetworksAnnotation] = "net-a";

    EXPECT_CALL(mCluster, GetLogicalNetwork("default", "net-a", _))
        .WillOnce(Return(Error(ErrorEnum::eNotFound, "not found")));

    SelectionResult result;

    EXPECT_TRUE(mSelector.Select(mCtx, result).Is(ErrorEnum::eSelectionFailure));

    mCtx.mAnnotations[cNetworksAnnotation] = R"([{"interface": "eth1"}])";

    EXPECT_TRUE(mSelector.Select(mCtx, result).Is(ErrorEnum::eSelectionFailure));
}

TEST_F(BackendSelectorTest, Ranking)
{
    mCtx.mAnnotations["other"] = "value";

    EXPECT_CALL(mRanking, GetBestBackend(_)).WillOnce(DoAll(SetArgReferee<0>("weave"), Return(ErrorEnum::eNone)));

    SelectionResult result;

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());

    EXPECT_EQ(result.mSelections, std::vector<BackendSelection>({{"weave", "", ""}}));
    EXPECT_EQ(result.mAnnotationUpdates, (Annotations {{cCNIAnnotation, "weave"}}));
}

TEST_F(BackendSelectorTest, RankingFailure)
{
    mCtx.mDefaultPlugin = "bridge";

    EXPECT_CALL(mRanking, GetBestBackend(_)).WillOnce(Return(Error(ErrorEnum::eTimeout, "timeout")));

    SelectionResult result;

    EXPECT_TRUE(mSelector.Select(mCtx, result).Is(ErrorEnum::eSelectionFailure));
    EXPECT_TRUE(result.mSelections.empty());
}

TEST_F(BackendSelectorTest, DefaultPlugins)
{
    mCtx.mMetadataAvailable = false;

    SelectionResult result;

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());
    EXPECT_EQ(result.mSelections, std::vector<BackendSelection>({{"weave", "", ""}}));

    mCtx.mDefaultPlugin = "bridge,macvlan";

    ASSERT_TRUE(mSelector.Select(mCtx, result).IsNone());
    EXPECT_EQ(result.mSelections, std::vector<BackendSelection>({{"bridge", "", ""}, {"macvlan", "", ""}}));
    EXPECT_TRUE(result.mAnnotationUpdates.empty());
}
