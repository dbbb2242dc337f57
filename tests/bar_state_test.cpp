#define BOOST_TEST_MODULE BarStateTest
#include <boost/test/unit_test.hpp>
#include "avance/core/bar_state.hpp"
#include "avance/core/error_codes.hpp"
#include <atomic>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>

namespace avance {
namespace test {

namespace {

class CountingListener : public core::BarListener {
public:
	void onBarUpdated( core::BarState & ) override { ++updated; }
	void onBarFinished( core::BarState & ) override { ++finished; }
	void onBarReset( core::BarState & ) override { ++reset; }

	std::atomic<int> updated{0};
	std::atomic<int> finished{0};
	std::atomic<int> reset{0};
};

// Parks finish() inside the listener until released.
class BlockingListener : public core::BarListener {
public:
	void onBarUpdated( core::BarState & ) override {}
	void onBarReset( core::BarState & ) override {}
	void onBarFinished( core::BarState & ) override {
		std::unique_lock<std::mutex> lock( mutex );
		entered = true;
		cv.notify_all();
		cv.wait( lock, [this] { return released; } );
	}

	void waitEntered() {
		std::unique_lock<std::mutex> lock( mutex );
		cv.wait( lock, [this] { return entered; } );
	}
	void release() {
		std::lock_guard<std::mutex> lock( mutex );
		released = true;
		cv.notify_all();
	}

	std::mutex mutex;
	std::condition_variable cv;
	bool entered = false;
	bool released = false;
};

std::shared_ptr<core::BarState> makeBar( std::optional<uint64_t> total,
										 std::shared_ptr<core::BarListener> listener = nullptr )
{
	return std::make_shared<core::BarState>( 1, total, "test", core::StyleConfig(), listener );
}

}

BOOST_AUTO_TEST_CASE( concurrent_updates_sum_exactly )
{
	auto bar = makeBar( 80000 );
	std::vector<std::thread> workers;
	for( int t = 0; t < 8; ++t ) {
		workers.emplace_back( [&] {
			for( int i = 0; i < 10000; ++i )
				bar->update( 1 );
		} );
	}
	for( auto &w : workers ) w.join();

	BOOST_CHECK_EQUAL( bar->current(), 80000 );
	BOOST_CHECK( !bar->isFinished() ); //reaching total does not finish
}

BOOST_AUTO_TEST_CASE( update_saturates_at_maximum )
{
	const auto max = std::numeric_limits<uint64_t>::max();
	auto bar = makeBar( std::nullopt );
	bar->update( max - 1 );
	bar->update( 5 );
	BOOST_CHECK_EQUAL( bar->current(), max );
}

BOOST_AUTO_TEST_CASE( set_is_plain_assignment )
{
	auto bar = makeBar( 100 );
	bar->set( 10 );
	bar->set( 3 );
	BOOST_CHECK_EQUAL( bar->current(), 3 );
}

BOOST_AUTO_TEST_CASE( finish_notifies_once )
{
	auto listener = std::make_shared<CountingListener>();
	auto bar = makeBar( 10, listener );
	bar->finish();
	bar->finish();
	BOOST_CHECK( bar->isFinished() );
	BOOST_CHECK_EQUAL( listener->finished.load(), 1 );
}

BOOST_AUTO_TEST_CASE( updates_after_finish_are_counted_but_not_signalled )
{
	auto listener = std::make_shared<CountingListener>();
	auto bar = makeBar( 10, listener );
	bar->update( 2 );
	BOOST_CHECK_EQUAL( listener->updated.load(), 1 );

	bar->finish();
	bar->update( 3 );
	BOOST_CHECK_EQUAL( bar->current(), 5 );
	BOOST_CHECK_EQUAL( listener->updated.load(), 1 );
}

BOOST_AUTO_TEST_CASE( reset_revives_finished_bar )
{
	auto listener = std::make_shared<CountingListener>();
	auto bar = makeBar( 10, listener );
	bar->update( 7 );
	bar->finish();
	bar->reset();

	BOOST_CHECK( !bar->isFinished() );
	BOOST_CHECK_EQUAL( bar->current(), 0 );
	BOOST_CHECK_EQUAL( listener->reset.load(), 1 );

	bar->finish();
	BOOST_CHECK_EQUAL( listener->finished.load(), 2 ); //each lifecycle finishes once
}

BOOST_AUTO_TEST_CASE( reset_during_finish_is_rejected )
{
	auto listener = std::make_shared<BlockingListener>();
	auto bar = makeBar( 10, listener );

	std::thread finisher( [&] { bar->finish(); } );
	listener->waitEntered();

	try {
		bar->reset();
		BOOST_ERROR( "reset() should have thrown" );
	} catch( const core::InvalidStateError &e ) {
		BOOST_CHECK( e.code() == core::ProgressErrorCode::LIFECYCLE_RACE );
		BOOST_CHECK_EQUAL( e.context().operation, "reset" );
		BOOST_REQUIRE( e.context().row_id );
		BOOST_CHECK_EQUAL( *e.context().row_id, bar->rowId() );
		BOOST_CHECK( std::string( e.what() ).find( "row_id=" + std::to_string( bar->rowId() ) ) != std::string::npos );
	}

	listener->release();
	finisher.join();
	BOOST_CHECK( bar->isFinished() );
}

BOOST_AUTO_TEST_CASE( text_is_sanitized )
{
	auto bar = makeBar( 10 );
	bar->setDescription( "line\nbreak" );
	bar->setPostfix( "loss=\x1b[31m0.1" );

	auto snap = bar->snapshot();
	BOOST_CHECK_EQUAL( snap.description, "line<0A>break" );
	BOOST_CHECK_EQUAL( snap.postfix, "loss=<1B>[31m0.1" );
}

BOOST_AUTO_TEST_CASE( elapsed_freezes_at_finish )
{
	auto bar = makeBar( 10 );
	bar->finish();
	auto later = core::BarState::Clock::now() + std::chrono::hours( 1 );
	BOOST_CHECK( bar->elapsed( later ).count() < 60.0 );
}

BOOST_AUTO_TEST_CASE( snapshot_reflects_last_update )
{
	auto bar = makeBar( 10 );
	bar->update( 4 );
	auto snap = bar->snapshot();
	BOOST_CHECK_EQUAL( snap.current, 4 );
	BOOST_CHECK( snap.total && *snap.total == 10 );
	BOOST_CHECK_EQUAL( snap.description, "test" );
	BOOST_CHECK( !snap.finished );
	BOOST_CHECK( snap.last_update_time >= snap.start_time );
}

}}
