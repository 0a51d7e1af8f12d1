#include "watcher.hpp"
#include "logger.hpp"

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <errno.h>
#include <thread>

class WatcherTest : public ::testing::Test {
    protected:
        void SetUp() override {
            Logger::set_level( Logger::Level::NONE );
        }

        void TearDown() override {
            watcher.close();
            if( poller.joinable() ) {
                poller.join();
            }
        }

        // start polling in the background and wait until the loop is live
        void run( std::chrono::milliseconds interval = std::chrono::milliseconds(10) ) {
            poller = std::thread{ [this, interval] { watcher.start( interval ); } };
            watcher.wait();
        }

        Channel<Event>::Status next( Event& event, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000) ) {
            return watcher.events().receive_for( event, timeout );
        }

        // true if no event shows up within timeout
        bool quiet( std::chrono::milliseconds timeout = std::chrono::milliseconds(300) ) {
            Event event{};
            return next( event, timeout ) == Channel<Event>::Status::Timeout;
        }

        TempDir dir;
        Watcher watcher;
        std::thread poller;
};

TEST_F(WatcherTest, AddListsImmediately) {
    dir.write( "f1", "0123456789" );
    dir.mkdir( "sub" );
    dir.write( "sub/f2", "x" );

    watcher.add( dir.path() );
    auto files = watcher.watched_files();
    EXPECT_EQ(files.size(), 3u);
    EXPECT_EQ(files.count( dir.path("sub/f2") ), 0u);

    watcher.add_recursive( dir.path() );
    EXPECT_EQ(watcher.watched_files().size(), 4u);
}

TEST_F(WatcherTest, AddMissingPathThrows) {
    EXPECT_THROW(watcher.add( dir.path("missing") ), NotFoundException);
    EXPECT_TRUE(watcher.watched_files().empty());
}

TEST_F(WatcherTest, AddIgnoredOrHiddenPathIsNoop) {
    dir.write( ".hidden", "h" );
    dir.mkdir( "skip" );

    watcher.ignore( dir.path("skip") );
    watcher.add( dir.path("skip") );

    watcher.ignore_hidden_files( true );
    watcher.add( dir.path(".hidden") );

    EXPECT_TRUE(watcher.watched_files().empty());
}

TEST_F(WatcherTest, StartWithTooShortIntervalFailsAndStaysStartable) {
    EXPECT_THROW(watcher.start( std::chrono::nanoseconds(0) ), DurationTooShortException);
    EXPECT_FALSE(watcher.is_running());

    run();
    EXPECT_TRUE(watcher.is_running());
}

TEST_F(WatcherTest, SecondStartFailsWhileRunning) {
    run();
    EXPECT_THROW(watcher.start( std::chrono::milliseconds(10) ), AlreadyRunningException);
    EXPECT_TRUE(watcher.is_running());
}

TEST_F(WatcherTest, ConcurrentStartsRunOneLoop) {
    std::atomic<int> rejected{0};
    auto starter = [this, &rejected] {
        try {
            watcher.start( std::chrono::milliseconds(10) );
        } catch( AlreadyRunningException& ) {
            rejected++;
        }
    };
    std::thread t1{ starter };
    std::thread t2{ starter };
    watcher.wait();

    // the rejected call returns immediately, the other one runs until close()
    for( int i=0; i<300 && rejected.load() == 0; i++ ) {
        std::this_thread::sleep_for( std::chrono::milliseconds(10) );
    }
    EXPECT_TRUE(watcher.is_running());
    watcher.close();
    t1.join();
    t2.join();
    EXPECT_EQ(rejected.load(), 1);
}

TEST_F(WatcherTest, ModificationIsReportedAsSingleWrite) {
    dir.write( "f1", "0123456789" );
    dir.set_mtime( "f1", 1000 );
    watcher.add( dir.path() );
    run();

    dir.set_mtime( "f1", 2000 );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.op, Event::Op::Write);
    EXPECT_EQ(event.path, dir.path("f1"));
    EXPECT_EQ(event.info.size, 10);
    EXPECT_TRUE(quiet());
}

TEST_F(WatcherTest, RenameInSameDirectory) {
    dir.write( "f1", "0123456789" );
    dir.set_mtime( "f1", 1000 );
    watcher.add( dir.path() );
    // the directory's own timestamp changes too
    watcher.filter_ops( { Event::Op::Create, Event::Op::Remove, Event::Op::Rename, Event::Op::Move } );
    run();

    dir.rename( "f1", "f2" );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.op, Event::Op::Rename);
    EXPECT_EQ(event.path, dir.path("f1") + " -> " + dir.path("f2"));
    EXPECT_EQ(event.info.name, "f1");
    EXPECT_TRUE(quiet());
}

TEST_F(WatcherTest, MoveAcrossDirectories) {
    dir.mkdir( "a" );
    dir.mkdir( "b" );
    dir.write( "a/x", "payload" );
    watcher.add_recursive( dir.path() );
    watcher.filter_ops( { Event::Op::Create, Event::Op::Remove, Event::Op::Rename, Event::Op::Move } );
    run();

    dir.rename( "a/x", "b/x" );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.op, Event::Op::Move);
    EXPECT_EQ(event.path, dir.path("a/x") + " -> " + dir.path("b/x"));
}

TEST_F(WatcherTest, ChmodIsReported) {
    dir.write( "f1", "x" );
    dir.chmod( "f1", 0644 );
    watcher.add( dir.path() );
    run();

    dir.chmod( "f1", 0600 );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.op, Event::Op::Chmod);
    EXPECT_EQ(event.info.mode, static_cast<mode_t>(0600));
}

TEST_F(WatcherTest, MaxEventsDropsTheRestOfTheCycle) {
    watcher.add( dir.path() );
    watcher.set_max_events( 1 );
    watcher.filter_ops( { Event::Op::Create } );
    run( std::chrono::milliseconds(20) );

    // the loop blocks handing over this create while the next two appear
    dir.write( "a", "" );
    std::this_thread::sleep_for( std::chrono::milliseconds(300) );
    dir.write( "b", "" );
    dir.write( "c", "" );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.path, dir.path("a"));

    // b and c land in the same cycle, only the first one is delivered
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.path, dir.path("b"));
    EXPECT_TRUE(quiet());

    EXPECT_EQ(watcher.watched_files().count( dir.path("c") ), 1u);
}

TEST_F(WatcherTest, IgnoredSubtreeIsPurgedAndNeverListed) {
    dir.mkdir( "sub" );
    dir.write( "sub/f1", "x" );
    dir.write( "top", "x" );
    watcher.add_recursive( dir.path() );
    watcher.ignore( dir.path("sub") );

    for( const auto& entry : watcher.watched_files() ) {
        EXPECT_NE(entry.first.find( dir.path("sub") ), 0u);
    }

    watcher.filter_ops( { Event::Op::Create } );
    run();
    dir.write( "sub/f2", "x" );
    EXPECT_TRUE(quiet());

    for( const auto& entry : watcher.watched_files() ) {
        EXPECT_NE(entry.first.find( dir.path("sub") ), 0u);
    }
}

TEST_F(WatcherTest, SiblingSharingIgnoredPrefixIsCreatedOnce) {
    dir.write( "a", "x" );
    watcher.add( dir.path() );
    watcher.ignore( dir.path("a") );
    watcher.filter_ops( { Event::Op::Create } );
    run( std::chrono::milliseconds(20) );

    dir.write( "ab", "x" );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.path, dir.path("ab"));
    EXPECT_TRUE(quiet());
    EXPECT_EQ(watcher.watched_files().count( dir.path("ab") ), 1u);
    EXPECT_EQ(watcher.watched_files().count( dir.path("a") ), 0u);
}

TEST_F(WatcherTest, HiddenFilesAreSkipped) {
    watcher.ignore_hidden_files( true );
    watcher.add( dir.path() );
    watcher.filter_ops( { Event::Op::Create } );
    run();

    dir.write( ".swap", "x" );
    dir.write( "visible", "x" );

    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.path, dir.path("visible"));
    EXPECT_TRUE(quiet());
}

TEST_F(WatcherTest, DeletedRootIsReportedAndDeregistered) {
    dir.write( "f1", "x" );
    watcher.add( dir.path("f1") );
    run();

    dir.remove( "f1" );

    std::exception_ptr error;
    ASSERT_EQ(watcher.errors().receive_for( error, std::chrono::milliseconds(3000) ),
              Channel<std::exception_ptr>::Status::Ok);
    EXPECT_THROW(std::rethrow_exception( error ), WatchedFileDeletedException);
    EXPECT_TRUE(quiet());
    EXPECT_TRUE(watcher.watched_files().empty());
}

TEST_F(WatcherTest, UnreadableRootIsReportedAndKeepsItsEntries) {
    dir.mkdir( "w" );
    dir.write( "w/f1", "x" );
    watcher.add( dir.path("w") );
    run();

    // a self-referencing link fails with ELOOP, not ENOENT
    dir.rename( "w", "w.old" );
    dir.symlink( "w", "w" );

    std::exception_ptr error;
    for( int i=0; i<2; i++ ) {
        ASSERT_EQ(watcher.errors().receive_for( error, std::chrono::milliseconds(3000) ),
                  Channel<std::exception_ptr>::Status::Ok);
        try {
            std::rethrow_exception( error );
        } catch( NotFoundException& ) {
            FAIL() << "root reported as deleted";
        } catch( FileSystemException& e ) {
            EXPECT_EQ(e.path(), dir.path("w"));
            EXPECT_EQ(e.error_code(), ELOOP);
        }
    }

    // the second error means the previous cycle was delivered and committed
    EXPECT_TRUE(quiet());
    auto files = watcher.watched_files();
    EXPECT_EQ(files.count( dir.path("w") ), 1u);
    EXPECT_EQ(files.count( dir.path("w/f1") ), 1u);
}

TEST_F(WatcherTest, RootAddedWhileRunningDoesNotReportExistingFiles) {
    dir.mkdir( "a" );
    dir.mkdir( "b" );
    dir.write( "b/existing", "x" );
    watcher.add( dir.path("a") );
    watcher.filter_ops( { Event::Op::Create } );
    run();

    watcher.add( dir.path("b") );
    EXPECT_TRUE(quiet());

    dir.write( "b/new", "x" );
    Event event{};
    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    EXPECT_EQ(event.path, dir.path("b/new"));
    EXPECT_TRUE(quiet());
}

TEST_F(WatcherTest, TriggerEvent) {
    Event event{};
    std::thread trigger{ [this] { EXPECT_TRUE(watcher.trigger_event( Event::Op::Create )); } };
    run();

    ASSERT_EQ(next( event ), Channel<Event>::Status::Ok);
    trigger.join();
    EXPECT_EQ(event.op, Event::Op::Create);
    EXPECT_EQ(event.path, "-");
    EXPECT_EQ(event.info.name, "triggered event");
}

TEST_F(WatcherTest, CloseStopsLoopOnce) {
    dir.write( "f1", "x" );
    watcher.add( dir.path() );
    run();

    watcher.close();
    EXPECT_TRUE(watcher.closed());
    EXPECT_FALSE(watcher.is_running());
    EXPECT_TRUE(watcher.watched_files().empty());

    Event event{};
    EXPECT_FALSE(watcher.events().receive( event ));

    watcher.close();
    EXPECT_THROW(watcher.start( std::chrono::milliseconds(10) ), WatcherClosedException);
}

TEST_F(WatcherTest, CloseAbortsBlockedDelivery) {
    watcher.add( dir.path() );
    watcher.filter_ops( { Event::Op::Create } );
    run();

    // nobody receives: the loop stays blocked on this create
    dir.write( "f1", "x" );
    std::this_thread::sleep_for( std::chrono::milliseconds(100) );

    watcher.close();
    EXPECT_TRUE(watcher.wait_closed_for( std::chrono::seconds(3) ));
    poller.join();
}

TEST_F(WatcherTest, CloseBeforeStartIsNoop) {
    watcher.close();
    EXPECT_FALSE(watcher.closed());
    run();
    EXPECT_TRUE(watcher.is_running());
}
