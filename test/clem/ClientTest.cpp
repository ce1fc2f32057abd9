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

#include "clem/ClientTest.hpp"


TEST_F(ClientFixture, start1)
{
    PlayerServer server{playerScript};
    Client client{createParameters(server.port, 1234)};

    client.start();
    EXPECT_TRUE(client.isConnected());
    EXPECT_TRUE(client.isRunning());

    ASSERT_TRUE(waitFor([&] {return client.getTrackPosition().value_or(0) == 444;}));

    auto track{client.getCurrentTrack()};
    ASSERT_TRUE(track.has_value());
    EXPECT_EQ("Born Slippy", track.value().title);
    EXPECT_EQ("Underworld", track.value().artist);
    EXPECT_EQ(443, track.value().length);
    EXPECT_TRUE(client.isFirstSnapshotReceived());
    EXPECT_EQ(65, client.getVolume().value());
    EXPECT_EQ(clem::TransportStatus::Playing, client.getTransportStatus());

    auto playlists{client.getPlaylists()};
    ASSERT_EQ(2u, playlists.size());
    EXPECT_EQ("Techno", playlists[0].name);
    EXPECT_EQ(1, client.snapshot()->activePlaylistID.value());
    EXPECT_EQ("1.4.0", client.snapshot()->version.value());

    client.stop();
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, client.getConnectionStatus());
    EXPECT_FALSE(client.isRunning());

    // handshake carried the auth code and the player was told good-bye
    ASSERT_TRUE(waitFor([&] {return server.getReceivedMessages().size() == 2;}));
    auto messages{server.getReceivedMessages()};
    EXPECT_EQ(clem::pb::CONNECT, messages[0].type());
    EXPECT_EQ(1234, messages[0].request_connect().auth_code());
    EXPECT_EQ(clem::pb::DISCONNECT, messages[1].type());
}


TEST_F(ClientFixture, start2)
{
    PlayerServer server{playerScript};
    Client client{createParameters(server.port, 1111, true)};

    EXPECT_THROW(client.start(), clem::AuthRejectedError);
    EXPECT_FALSE(client.isRunning());
    EXPECT_FALSE(client.isConnected());

    // rejected auth is never retried
    std::this_thread::sleep_for(std::chrono::milliseconds{300});
    EXPECT_EQ(1u, client.getConnectAttempts());
    EXPECT_EQ(1u, server.connections.load());
}


TEST_F(ClientFixture, start3)
{
    // player that never answers the handshake
    PlayerServer server{[](auto& server, auto& socket)
    {
        server.readAll(socket);
    }};
    Client client{createParameters(server.port, 1234)};

    EXPECT_THROW(client.start(), clem::AuthTimeoutError);
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, client.getConnectionStatus());
    EXPECT_FALSE(client.getLastError().empty());
}


TEST_F(ClientFixture, start4)
{
    Client client{createParameters(getClosedPort())};

    EXPECT_THROW(client.start(), clem::TransportError);
    EXPECT_FALSE(client.isRunning());
    EXPECT_EQ(1u, client.getConnectAttempts());
}


TEST_F(ClientFixture, start5)
{
    Client client{createParameters(getClosedPort(), ts::nullopt, true)};

    // with reconnect enabled a refused connection is not an error for the caller
    EXPECT_NO_THROW(client.start());
    EXPECT_TRUE(client.isRunning());
    EXPECT_TRUE(waitFor([&] {return client.getConnectAttempts() >= 3;}));

    client.stop();
    EXPECT_FALSE(client.isRunning());
}


TEST_F(ClientFixture, start6)
{
    PlayerServer server{[](auto& server, auto& socket)
    {
        if (server.readMessage(socket).has_value())
        {
            server.write(socket, PlayerMessages::info("1.4.0"));

            // letting the client complete its handshake before the connection is dropped
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
    }};
    Client client{createParameters(server.port)};

    client.start();

    // without reconnect a lost connection ends the run
    ASSERT_TRUE(waitFor([&] {return !client.isRunning();}));
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, client.getConnectionStatus());

    // so starting again makes a new connect attempt
    client.start();
    EXPECT_EQ(2u, client.getConnectAttempts());
    EXPECT_TRUE(waitFor([&] {return server.connections == 2;}));
}


TEST_F(ClientFixture, start7)
{
    // auth rejected while reconnecting: retrying is over and start() may be used again
    std::atomic<unsigned int> accepted{0};
    PlayerServer server{[&](auto& server, auto& socket)
    {
        auto handshake{server.readMessage(socket)};
        if (!handshake.has_value())
        {
            return;
        }

        if (accepted++ == 0)
        {
            server.write(socket, PlayerMessages::info("1.4.0"));
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        else
        {
            server.write(socket, PlayerMessages::disconnect(clem::pb::Wrong_Auth_Code));
        }
    }};
    Client client{createParameters(server.port, 1234, true)};

    client.start();

    ASSERT_TRUE(waitFor([&] {return !client.isRunning();}));
    EXPECT_EQ(2u, client.getConnectAttempts());
    EXPECT_FALSE(client.getLastError().empty());

    EXPECT_THROW(client.start(), clem::AuthRejectedError);
    EXPECT_EQ(3u, client.getConnectAttempts());
}


TEST_F(ClientFixture, reconnect1)
{
    // player that drops every connection right after the handshake
    PlayerServer server{[](auto& server, auto& socket)
    {
        if (server.readMessage(socket).has_value())
        {
            server.write(socket, PlayerMessages::info("1.4.0"));
        }
    }};
    Client client{createParameters(server.port, ts::nullopt, true)};

    client.start();
    ASSERT_TRUE(waitFor([&] {return client.getConnectAttempts() >= 3;}));
    ASSERT_TRUE(waitFor([&] {return server.connections >= 3;}));

    client.stop();
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, client.getConnectionStatus());

    // no further attempts once stopped
    auto attempts{client.getConnectAttempts()};
    auto connections{server.connections.load()};
    std::this_thread::sleep_for(std::chrono::milliseconds{500});
    EXPECT_EQ(attempts, client.getConnectAttempts());
    EXPECT_EQ(connections, server.connections.load());
}


TEST_F(ClientFixture, reconnect2)
{
    PlayerServer server{[](auto& server, auto& socket)
    {
        if (server.readMessage(socket).has_value())
        {
            server.write(socket, PlayerMessages::info("1.4.0"));

            // letting the client complete its handshake before the connection is dropped
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
    }};
    Client client{createParameters(server.port)};

    client.start();

    // connection loss without reconnect is only visible through the status
    ASSERT_TRUE(waitFor([&] {return client.getConnectionStatus() == clem::ConnectionStatus::Disconnected;}));
    std::this_thread::sleep_for(std::chrono::milliseconds{300});
    EXPECT_EQ(1u, client.getConnectAttempts());
    EXPECT_EQ(1u, server.connections.load());
    EXPECT_FALSE(client.play());
}


TEST_F(ClientFixture, send1)
{
    PlayerServer server{playerScript};
    Client client{createParameters(server.port)};

    client.start();

    EXPECT_THROW(client.setVolume(150), clem::ValidationError);
    EXPECT_TRUE(client.play());
    EXPECT_TRUE(client.setVolume(30));
    EXPECT_TRUE(client.changeSong(1, 2));

    ASSERT_TRUE(waitFor([&] {return server.getReceivedMessages().size() == 4;}));
    auto messages{server.getReceivedMessages()};
    EXPECT_EQ(clem::pb::PLAY, messages[1].type());
    EXPECT_EQ(clem::pb::SET_VOLUME, messages[2].type());
    EXPECT_EQ(30, messages[2].request_set_volume().volume());
    EXPECT_EQ(clem::pb::CHANGE_SONG, messages[3].type());
}


TEST_F(ClientFixture, send2)
{
    Client client{createParameters(getClosedPort())};

    // commands before start are reported, not thrown
    EXPECT_FALSE(client.next());
    EXPECT_THROW(client.setVolume(101), clem::ValidationError);
}


TEST_F(ClientFixture, send3)
{
    auto parameters{createParameters(getClosedPort())};
    parameters.setStrictCommands(true);
    Client client{parameters};

    EXPECT_THROW(client.pause(), clem::CommandOnDisconnectedSessionError);
}


TEST_F(ClientFixture, setMessageCallback1)
{
    PlayerServer server{playerScript};
    Client client{createParameters(server.port)};
    std::atomic<unsigned int> ticks{0};

    client.setMessageCallback([&](const clem::proto::Message& message)
    {
        if (std::holds_alternative<clem::proto::inbound::PositionTick>(message))
        {
            // mirror is updated before listeners are notified
            EXPECT_EQ(444, client.getTrackPosition().value_or(0));
            ticks++;
        }
    });
    client.start();

    EXPECT_TRUE(waitFor([&] {return ticks == 1;}));
}


TEST_F(ClientFixture, stop1)
{
    PlayerServer server{playerScript};
    Client client{createParameters(server.port)};

    // stopping a client which was never started
    client.stop();

    client.start();
    client.stop();
    client.stop();

    EXPECT_FALSE(client.isRunning());
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, client.getConnectionStatus());
}


TEST_F(ClientFixture, stop2)
{
    PlayerServer server{playerScript};
    Client client{createParameters(server.port)};
    std::atomic<bool> stopped{false};
    std::atomic<long long> elapsed{0};

    client.setMessageCallback([&](const clem::proto::Message& message)
    {
        if (std::holds_alternative<clem::proto::inbound::PositionTick>(message))
        {
            auto begin{std::chrono::steady_clock::now()};
            client.stop();
            elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin).count();
            stopped = true;
        }
    });
    client.start();

    // stopping from the receive thread does not wait for teardown, which would need this very thread
    ASSERT_TRUE(waitFor([&] {return stopped.load();}));
    EXPECT_LT(elapsed.load(), 1000);
    EXPECT_FALSE(client.isRunning());
    EXPECT_TRUE(waitFor([&] {return client.getConnectionStatus() == clem::ConnectionStatus::Disconnected;}));
}


TEST_F(ClientFixture, stop3)
{
    // address nobody answers; the connect attempt stays pending until it is stopped
    auto parameters{createParameters(5500)};
    parameters.setHost(UnreachableHost);
    parameters.setConnectTimeout(std::chrono::seconds{20});
    Client client{parameters};
    std::atomic<bool> failed{false};
    std::atomic<bool> done{false};

    std::thread thread{[&]
    {
        try
        {
            client.start();
        }
        catch (const clem::TransportError&)
        {
            failed = true;
        }
        done = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{200});

    auto begin{std::chrono::steady_clock::now()};
    client.stop();
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin).count(), 1000);

    EXPECT_TRUE(waitFor([&] {return done.load();}));
    thread.join();
    EXPECT_TRUE(failed);
    EXPECT_FALSE(client.isRunning());
    EXPECT_EQ(clem::ConnectionStatus::Disconnected, client.getConnectionStatus());
}


TEST(Client, validate1)
{
    EXPECT_THROW(clem::Client<clem::conn::tcp::Connection>{clem::Parameters("", 5500, ts::nullopt, false)}, clem::ValidationError);
}
