// tests/readbuf/read_bufs_test.cpp
// Unit tests for ReadBufs (vectored initialization tracking)

#include <gtest/gtest.h>

#include <array>
#include <cstring>

#include "readbuf/read_bufs.hpp"
#include "test_helpers.hpp"

using namespace readbuf;
using namespace readbuf::test;

namespace
{
template <size_t N>
void Dirty(std::array<UninitByte, N>& storage, std::byte fill)
{
    for (auto& b : storage)
    {
        b.value = fill;
    }
}
}  // namespace

TEST(IoSliceTest, LayoutMatchesIovec)
{
    std::array<UninitByte, 7> storage;
    UninitIoSlice slice{storage};
    const auto* iov = reinterpret_cast<const iovec*>(&slice);
    EXPECT_EQ(iov->iov_base, storage.data());
    EXPECT_EQ(iov->iov_len, 7u);
    EXPECT_EQ(slice.Len(), 7u);
    EXPECT_EQ(slice.AsUninit().data(), storage.data());
}

class ReadBufsTest : public ::testing::Test
{
protected:
    std::array<UninitByte, 5> buf1;
    std::array<UninitByte, 0> buf2;
    std::array<UninitByte, 3> buf3;

    void SetUp() override
    {
        Dirty(buf1, std::byte{1});
        Dirty(buf3, std::byte{3});
    }
};

TEST_F(ReadBufsTest, FromInit)
{
    std::array<std::byte, 5> init1;
    std::array<std::byte, 0> init2;
    std::array<std::byte, 3> init3;
    init1.fill(std::byte{1});
    init3.fill(std::byte{3});
    std::array slices{IoSliceMut{init1}, IoSliceMut{init2}, IoSliceMut{init3}};
    auto bufs = ReadBufs::FromInit(slices);

    EXPECT_EQ(bufs.Initialized(), 8u);
    EXPECT_EQ(bufs.TotalLen(), 8u);

    auto [head, tail] = bufs.AsSlices();
    EXPECT_EQ(head.size(), 3u);
    EXPECT_TRUE(tail.empty());

    auto init = bufs.AsInit();
    ASSERT_EQ(init.size(), 3u);
    EXPECT_EQ(init[0].Len(), 5u);
    EXPECT_TRUE(AllEqual(init[0].Span(), std::byte{1}));
    EXPECT_EQ(init[1].Len(), 0u);
    EXPECT_EQ(init[2].Len(), 3u);
    EXPECT_TRUE(AllEqual(init[2].Span(), std::byte{3}));
}

TEST_F(ReadBufsTest, FromUninitRoundsUpToSliceBoundary)
{
    std::array slices{UninitIoSlice{buf1}, UninitIoSlice{buf2}, UninitIoSlice{buf3}};
    auto bufs = ReadBufs::Uninit(slices);

    EXPECT_EQ(bufs.Initialized(), 0u);

    auto [head, tail] = bufs.AsSlices();
    EXPECT_TRUE(head.empty());
    EXPECT_EQ(tail.size(), 3u);

    auto partial = bufs.AsInitTo(1);
    ASSERT_EQ(partial.size(), 1u);
    EXPECT_EQ(partial[0].Len(), 5u);
    EXPECT_TRUE(AllEqual(partial[0].Span(), std::byte{0}));
    std::memset(partial[0].Span().data(), 4, 5);

    EXPECT_EQ(bufs.Initialized(), 5u);
}

TEST_F(ReadBufsTest, AsSlicesNeverSplitsASlice)
{
    std::array slices{UninitIoSlice{buf1}, UninitIoSlice{buf2}, UninitIoSlice{buf3}};
    auto bufs = ReadBufs::Uninit(slices);

    // Cursor inside the first slice: nothing is reported initialized.
    bufs.AssumeInitialized(3);
    auto [head, tail] = bufs.AsSlices();
    EXPECT_TRUE(head.empty());
    EXPECT_EQ(tail.size(), 3u);

    // Cursor at the end of the first slice: the empty slice comes along with it.
    bufs.AssumeInitialized(5);
    auto [head2, tail2] = bufs.AsSlices();
    ASSERT_EQ(head2.size(), 2u);
    EXPECT_EQ(head2[0].Len(), 5u);
    EXPECT_EQ(tail2.size(), 1u);

    // Cursor inside the last slice.
    bufs.AssumeInitialized(7);
    auto [head3, tail3] = bufs.AsSlices();
    EXPECT_EQ(head3.size(), 2u);
    EXPECT_EQ(tail3.size(), 1u);
    for (const auto& slice : head3)
    {
        EXPECT_EQ(slice.Span().size(), slice.Len());
    }
}

TEST_F(ReadBufsTest, AsInitToKeepsInitializedPrefixOfCrossingSlice)
{
    std::array slices{UninitIoSlice{buf1}, UninitIoSlice{buf2}, UninitIoSlice{buf3}};
    auto bufs = ReadBufs::Uninit(slices);

    // Pretend a read wrote 2 bytes into the first slice.
    buf1[0].value = std::byte{9};
    buf1[1].value = std::byte{9};
    bufs.AssumeInitialized(2);

    auto init = bufs.AsInitTo(4);
    ASSERT_EQ(init.size(), 1u);
    const std::array<std::byte, 5> expected{std::byte{9}, std::byte{9}, std::byte{0}, std::byte{0}, std::byte{0}};
    EXPECT_TRUE(SpansEqual(init[0].Span(), expected));
    EXPECT_EQ(bufs.Initialized(), 5u);
}

TEST_F(ReadBufsTest, AsInitToSpanningSlices)
{
    std::array slices{UninitIoSlice{buf1}, UninitIoSlice{buf2}, UninitIoSlice{buf3}};
    auto bufs = ReadBufs::Uninit(slices);

    auto init = bufs.AsInitTo(6);
    ASSERT_EQ(init.size(), 3u);
    EXPECT_TRUE(AllEqual(init[0].Span(), std::byte{0}));
    EXPECT_TRUE(AllEqual(init[2].Span(), std::byte{0}));
    EXPECT_EQ(bufs.Initialized(), 8u);

    auto [head, tail] = bufs.AsSlices();
    EXPECT_EQ(head.size(), 3u);
    EXPECT_TRUE(tail.empty());
}

TEST(ReadBufsEmptyTest, NoSlices)
{
    auto bufs = ReadBufs::Uninit({});
    EXPECT_EQ(bufs.Count(), 0u);
    EXPECT_EQ(bufs.TotalLen(), 0u);
    EXPECT_TRUE(bufs.AsInit().empty());

    auto [head, tail] = bufs.AsSlices();
    EXPECT_TRUE(head.empty());
    EXPECT_TRUE(tail.empty());
}

TEST_F(ReadBufsTest, AsInitToPastEndTerminates)
{
    std::array slices{UninitIoSlice{buf1}, UninitIoSlice{buf2}, UninitIoSlice{buf3}};
    auto bufs = ReadBufs::Uninit(slices);
    EXPECT_DEATH(bufs.AsInitTo(9), "contract violation");
}

TEST_F(ReadBufsTest, AssumeInitializedPastEndTerminates)
{
    std::array slices{UninitIoSlice{buf1}, UninitIoSlice{buf2}, UninitIoSlice{buf3}};
    auto bufs = ReadBufs::Uninit(slices);
    EXPECT_DEATH(bufs.AssumeInitialized(9), "contract violation");
}
