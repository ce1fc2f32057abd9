/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "clem/PlayerState.hpp"
#include "clem/proto/Message.hpp"
#include "clem/StateMirror.hpp"


namespace inbound = clem::proto::inbound;


auto createTrack(std::string title, std::string artist, std::string album, int length)
{
    auto track{clem::Track{}};

    track.title  = std::move(title);
    track.artist = std::move(artist);
    track.album  = std::move(album);
    track.length = length;

    return track;
}


TEST(StateMirror, initialState1)
{
    clem::StateMirror mirror;

    EXPECT_FALSE(mirror.getCurrentTrack().has_value());
    EXPECT_FALSE(mirror.getVolume().has_value());
    EXPECT_FALSE(mirror.getTrackPosition().has_value());
    EXPECT_TRUE(mirror.getPlaylists().empty());
    EXPECT_FALSE(mirror.isFirstSnapshotReceived());
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, mirror.getConnectionStatus());
    EXPECT_EQ(clem::TransportStatus::Unknown, mirror.getTransportStatus());
}


TEST(StateMirror, applySnapshot1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::PlaylistListing{{{1, "Old", 5, true, false}}});
    mirror.apply(inbound::TrackMetadata{createTrack("Old Song", "Old Artist", "Old Album", 100)});

    auto track{createTrack("Born Slippy", "Underworld", "", 443)};
    auto playlists{std::vector<clem::Playlist>{{2, "Techno", 12, true, false}, {3, "Jazz", 3, false, false}}};
    mirror.apply(inbound::FullSnapshot{track, playlists});

    // snapshot values replace everything received before
    ASSERT_TRUE(mirror.getCurrentTrack().has_value());
    EXPECT_EQ(track, mirror.getCurrentTrack().value());
    EXPECT_EQ(playlists, mirror.getPlaylists());
    EXPECT_TRUE(mirror.isFirstSnapshotReceived());
}


TEST(StateMirror, applySnapshot2)
{
    clem::StateMirror mirror;
    auto track{createTrack("Born Slippy", "Underworld", "", 443)};

    mirror.apply(inbound::TrackMetadata{track});
    mirror.apply(inbound::PlaylistListing{{{1, "Techno", 5, true, false}}});
    mirror.apply(inbound::FullSnapshot{});

    // an empty snapshot marker keeps what was received so far
    ASSERT_TRUE(mirror.getCurrentTrack().has_value());
    EXPECT_EQ(track, mirror.getCurrentTrack().value());
    EXPECT_EQ(1u, mirror.getPlaylists().size());
    EXPECT_TRUE(mirror.isFirstSnapshotReceived());
}


TEST(StateMirror, applySnapshot3)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::FullSnapshot{clem::ts::nullopt, clem::ts::nullopt, clem::TransportStatus::Paused, 130});

    EXPECT_EQ(clem::TransportStatus::Paused, mirror.getTransportStatus());
    ASSERT_TRUE(mirror.getVolume().has_value());
    EXPECT_EQ(100, mirror.getVolume().value());
}


TEST(StateMirror, applySnapshot4)
{
    clem::StateMirror mirror;
    auto playlists{std::vector<clem::Playlist>{{1, "Techno", 12, true, false}, {2, "Jazz", 3, false, false}}};

    mirror.apply(inbound::FullSnapshot{clem::ts::nullopt, playlists});

    // same listing gives the same active playlist as a playlist listing message
    auto statePtr{mirror.snapshot()};
    ASSERT_TRUE(statePtr->activePlaylistID.has_value());
    EXPECT_EQ(1, statePtr->activePlaylistID.value());

    mirror.apply(inbound::FullSnapshot{clem::ts::nullopt, std::vector<clem::Playlist>{{1, "Techno", 12, false, false}, {2, "Jazz", 3, true, false}}});
    ASSERT_TRUE(mirror.snapshot()->activePlaylistID.has_value());
    EXPECT_EQ(2, mirror.snapshot()->activePlaylistID.value());
}


TEST(StateMirror, applyTrackMetadata1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::TrackMetadata{createTrack("First", "Artist", "Album", 300)});
    mirror.apply(inbound::PositionTick{250});
    ASSERT_TRUE(mirror.getTrackPosition().has_value());
    EXPECT_EQ(250, mirror.getTrackPosition().value());

    // new track resets position
    mirror.apply(inbound::TrackMetadata{createTrack("Second", "Other", "", 200)});
    ASSERT_TRUE(mirror.getTrackPosition().has_value());
    EXPECT_EQ(0, mirror.getTrackPosition().value());

    // track is replaced as a whole so no field of the previous track remains
    ASSERT_TRUE(mirror.getCurrentTrack().has_value());
    EXPECT_EQ("Second", mirror.getCurrentTrack().value().title);
    EXPECT_EQ("", mirror.getCurrentTrack().value().album);
}


TEST(StateMirror, applyTrackMetadata2)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::TrackMetadata{createTrack("Resumed", "Artist", "", 300), 120});

    ASSERT_TRUE(mirror.getTrackPosition().has_value());
    EXPECT_EQ(120, mirror.getTrackPosition().value());
}


TEST(StateMirror, applyPositionTick1)
{
    clem::StateMirror mirror;
    auto track{createTrack("Born Slippy", "Underworld", "", 443)};

    mirror.apply(inbound::TrackMetadata{track});
    mirror.apply(inbound::PositionTick{-3});

    ASSERT_TRUE(mirror.getTrackPosition().has_value());
    EXPECT_EQ(0, mirror.getTrackPosition().value());

    mirror.apply(inbound::PositionTick{444});
    EXPECT_EQ(444, mirror.getTrackPosition().value());

    // ticks never touch the track
    EXPECT_EQ(track, mirror.getCurrentTrack().value());
}


TEST(StateMirror, applyVolumeChange1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::VolumeChange{55});
    EXPECT_EQ(55, mirror.getVolume().value());

    mirror.apply(inbound::VolumeChange{150});
    EXPECT_EQ(100, mirror.getVolume().value());

    mirror.apply(inbound::VolumeChange{-5});
    EXPECT_EQ(0, mirror.getVolume().value());
}


TEST(StateMirror, applyPlaylistListing1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::PlaylistListing{{{1, "Techno", 5, false, false}, {7, "Jazz", 3, true, false}}});

    auto statePtr{mirror.snapshot()};
    ASSERT_EQ(2u, statePtr->playlists.size());
    EXPECT_EQ("Techno", statePtr->playlists[0].name);
    EXPECT_EQ("Jazz", statePtr->playlists[1].name);
    ASSERT_TRUE(statePtr->activePlaylistID.has_value());
    EXPECT_EQ(7, statePtr->activePlaylistID.value());

    mirror.apply(inbound::ActivePlaylistChanged{1});
    EXPECT_EQ(1, mirror.snapshot()->activePlaylistID.value());
}


TEST(StateMirror, applyOther1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::ServerInfo{"1.4.0", clem::TransportStatus::Playing});
    mirror.apply(inbound::ShuffleChange{clem::ShuffleMode::Albums});
    mirror.apply(inbound::RepeatChange{clem::RepeatMode::Track});
    mirror.apply(inbound::TransportStatusChange{clem::TransportStatus::Stopped});
    mirror.apply(inbound::Unhandled{43});
    mirror.apply(inbound::Unhandled{50});
    mirror.apply(inbound::KeepAlive{});

    auto statePtr{mirror.snapshot()};
    EXPECT_EQ("1.4.0", statePtr->version.value());
    EXPECT_EQ(clem::ShuffleMode::Albums, statePtr->shuffleMode.value());
    EXPECT_EQ(clem::RepeatMode::Track, statePtr->repeatMode.value());
    EXPECT_EQ(clem::TransportStatus::Stopped, statePtr->transportStatus);
    EXPECT_EQ(2u, statePtr->unhandledMessages);
    EXPECT_TRUE(statePtr->lastUpdate.has_value());
    EXPECT_FALSE(statePtr->currentTrack.has_value());
}


TEST(StateMirror, snapshot1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::VolumeChange{10});
    auto statePtr{mirror.snapshot()};
    mirror.apply(inbound::VolumeChange{20});

    // snapshots are never modified after they were taken
    EXPECT_EQ(10, statePtr->volume.value());
    EXPECT_EQ(20, mirror.getVolume().value());
}


TEST(StateMirror, reset1)
{
    clem::StateMirror mirror;

    mirror.apply(inbound::TrackMetadata{createTrack("Born Slippy", "Underworld", "", 443)});
    mirror.apply(inbound::FullSnapshot{});
    mirror.setConnectionStatus(clem::ConnectionStatus::Connected);
    auto statePtr{mirror.snapshot()};

    mirror.reset();

    EXPECT_FALSE(mirror.getCurrentTrack().has_value());
    EXPECT_FALSE(mirror.isFirstSnapshotReceived());
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, mirror.getConnectionStatus());

    // readers holding an old snapshot keep seeing consistent data
    EXPECT_TRUE(statePtr->currentTrack.has_value());
    EXPECT_TRUE(statePtr->firstSnapshotReceived);
}


TEST(StateMirror, concurrentReaders1)
{
    clem::StateMirror mirror;
    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};

    auto trackA{createTrack("Born Slippy", "Underworld", "Second Toughest in the Infants", 443)};
    auto trackB{createTrack("Windowlicker", "Aphex Twin", "Windowlicker", 366)};

    mirror.apply(inbound::TrackMetadata{trackA});

    std::vector<std::thread> readers;
    for (auto i{0}; i < 4; i++)
    {
        readers.emplace_back([&]
        {
            while (!done)
            {
                auto track{mirror.getCurrentTrack()};

                // a reader observes either of the tracks but never a mix of both
                if (!track.has_value() || (track.value() != trackA && track.value() != trackB))
                {
                    torn = true;
                }
            }
        });
    }

    for (auto i{0}; i < 10000; i++)
    {
        mirror.apply(inbound::TrackMetadata{(i % 2) ? trackA : trackB});
    }
    done = true;

    for (auto& reader : readers)
    {
        reader.join();
    }

    EXPECT_FALSE(torn);
}
