#define BOOST_TEST_MODULE BarRegistryTest
#include <boost/test/unit_test.hpp>
#include "avance/render/bar_registry.hpp"
#include "avance/core/progress_bar.hpp"
#include "screen_emulator.hpp"
#include <algorithm>
#include <sstream>
#include <thread>
#include <vector>

namespace avance {
namespace test {

namespace {

struct RegistryFixture {
	std::ostringstream out;
	std::shared_ptr<render::BarRegistry> registry;

	explicit RegistryFixture( bool ansi = true ) {
		auto sink = std::make_unique<terminal::TerminalSink>( out, ansi );
		sink->setSize( 80, 24 );
		registry = render::BarRegistry::create( std::move( sink ), render::SchedulerMode::MANUAL );
	}

	std::vector<std::string> screen() const {
		ScreenEmulator emulator;
		emulator.feed( out.str() );
		return emulator.visible();
	}

	core::ProgressBar bar( uint64_t total, const std::string &desc,
						   core::LayoutMode layout = core::LayoutMode::STABLE ) {
		return core::ProgressBar( total, desc, core::StyleConfig().withLayout( layout ), registry );
	}
};

bool contains( const std::string &line, const std::string &needle )
{
	return line.find( needle ) != std::string::npos;
}

}

BOOST_AUTO_TEST_CASE( rows_follow_registration_order )
{
	RegistryFixture fx;
	auto a = fx.bar( 10, "alpha" );
	auto b = fx.bar( 10, "beta" );

	BOOST_CHECK_EQUAL( *fx.registry->position( a.rowId() ), 0 );
	BOOST_CHECK_EQUAL( *fx.registry->position( b.rowId() ), 1 );
	BOOST_CHECK( a.rowId() != b.rowId() );

	BOOST_CHECK( fx.registry->flush() );
	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 2 );
	BOOST_CHECK( contains( screen[0], "alpha: " ) );
	BOOST_CHECK( contains( screen[1], "beta: " ) );
}

BOOST_AUTO_TEST_CASE( stable_layout_freezes_finished_rows )
{
	RegistryFixture fx;
	auto a = fx.bar( 10, "alpha" );
	auto b = fx.bar( 10, "beta" );
	auto c = fx.bar( 10, "gamma" );
	fx.registry->flush();

	b.set( 10 );
	b.finish();

	BOOST_CHECK_EQUAL( *fx.registry->position( a.rowId() ), 0 );
	BOOST_CHECK_EQUAL( *fx.registry->position( c.rowId() ), 2 );
	BOOST_CHECK_EQUAL( fx.registry->activeCount(), 2 );

	a.update( 5 );
	c.update( 7 );
	fx.registry->flush();

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 3 );
	BOOST_CHECK( contains( screen[0], "alpha:  50%" ) );
	BOOST_CHECK( contains( screen[1], "beta: 100%" ) );
	BOOST_CHECK( contains( screen[1], "10/10" ) );
	BOOST_CHECK( contains( screen[2], "gamma:  70%" ) );

	a.finish(); // frozen prefix becomes scrollback, gamma keeps its row
	BOOST_CHECK_EQUAL( *fx.registry->position( c.rowId() ), 2 );
	c.update( 3 );
	fx.registry->flush();
	screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 3 );
	BOOST_CHECK( contains( screen[2], "gamma: 100%" ) );
}

BOOST_AUTO_TEST_CASE( compact_layout_moves_finished_rows_above )
{
	RegistryFixture fx;
	auto a = fx.bar( 10, "alpha", core::LayoutMode::COMPACT );
	auto b = fx.bar( 10, "beta", core::LayoutMode::COMPACT );
	auto c = fx.bar( 10, "gamma", core::LayoutMode::COMPACT );
	fx.registry->flush();
	BOOST_CHECK( fx.registry->layoutMode() == core::LayoutMode::COMPACT );

	b.finish();

	BOOST_CHECK( !fx.registry->position( b.rowId() ) );
	BOOST_CHECK_EQUAL( *fx.registry->position( a.rowId() ), 0 );
	BOOST_CHECK_EQUAL( *fx.registry->position( c.rowId() ), 1 );

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 3 );
	BOOST_CHECK( contains( screen[0], "beta: " ) );
	BOOST_CHECK( contains( screen[1], "alpha: " ) );
	BOOST_CHECK( contains( screen[2], "gamma: " ) );
}

BOOST_AUTO_TEST_CASE( coalesced_frame_shows_latest_value )
{
	RegistryFixture fx;
	auto bar = fx.bar( 1000, "burst" );
	fx.registry->flush();
	auto before = fx.registry->framesRendered();

	for( int i = 0; i < 1000; ++i )
		bar.inc();

	BOOST_CHECK( fx.registry->flush() );
	BOOST_CHECK_EQUAL( fx.registry->framesRendered(), before + 1 );

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 1 );
	BOOST_CHECK( contains( screen[0], "1000/1000" ) );
}

BOOST_AUTO_TEST_CASE( shared_bar_across_threads )
{
	RegistryFixture fx;
	auto bar = fx.bar( 100, "shared" );

	std::vector<std::thread> workers;
	for( int t = 0; t < 4; ++t ) {
		workers.emplace_back( [bar]() mutable {
			for( int i = 0; i < 25; ++i )
				bar.inc();
		} );
	}
	for( auto &w : workers ) w.join();

	fx.registry->flush();
	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 1 );
	BOOST_CHECK( contains( screen[0], "100%" ) );
	BOOST_CHECK( contains( screen[0], "100/100" ) );
	BOOST_CHECK( !bar.isFinished() );
}

BOOST_AUTO_TEST_CASE( dropped_handle_releases_row )
{
	RegistryFixture fx;
	uint64_t id = 0;
	{
		auto bar = fx.bar( 10, "scoped" );
		id = bar.rowId();
		bar.update( 4 );
		BOOST_CHECK_EQUAL( fx.registry->activeCount(), 1 );
	}

	BOOST_CHECK_EQUAL( fx.registry->activeCount(), 0 );
	BOOST_CHECK( !fx.registry->position( id ) );
	BOOST_CHECK( !fx.registry->schedulerState() ); //idle registry holds no scheduler

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 1 );
	BOOST_CHECK( contains( screen[0], "scoped:  40%" ) );
}

BOOST_AUTO_TEST_CASE( overflow_rows_are_folded )
{
	RegistryFixture fx;
	fx.registry->setMaxRows( 3 );

	std::vector<core::ProgressBar> bars;
	for( int i = 0; i < 5; ++i )
		bars.push_back( fx.bar( 10, "task" + std::to_string( i ) ) );
	fx.registry->flush();

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 3 );
	BOOST_CHECK( contains( screen[0], "task0" ) );
	BOOST_CHECK( contains( screen[1], "task1" ) );
	BOOST_CHECK_EQUAL( screen[2], "... (3 more hidden) ..." );
}

BOOST_AUTO_TEST_CASE( display_config_bounds_rows )
{
	RegistryFixture fx;
	common::DisplayConfig display;
	display.max_rows = 4;
	fx.registry->applyDisplayConfig( display );

	std::vector<core::ProgressBar> bars;
	for( int i = 0; i < 6; ++i )
		bars.push_back( fx.bar( 10, "job" + std::to_string( i ) ) );
	fx.registry->flush();

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 4 );
	BOOST_CHECK( contains( screen[2], "job2" ) );
	BOOST_CHECK_EQUAL( screen[3], "... (3 more hidden) ..." );
}

BOOST_AUTO_TEST_CASE( hidden_rows_show_final_line_when_block_completes )
{
	RegistryFixture fx;
	fx.registry->setMaxRows( 3 );

	std::vector<core::ProgressBar> bars;
	for( int i = 0; i < 5; ++i )
		bars.push_back( fx.bar( 10, "task" + std::to_string( i ) ) );
	fx.registry->flush();

	for( auto it = bars.rbegin(); it != bars.rend(); ++it ) {
		it->set( 10 );
		it->finish();
	}

	auto screen = fx.screen();
	BOOST_REQUIRE_EQUAL( screen.size(), 5 );
	for( int i = 0; i < 5; ++i )
		BOOST_CHECK_MESSAGE( contains( screen[i], "task" + std::to_string( i ) + ": 100%" ), screen[i] );
	BOOST_CHECK( std::none_of( screen.begin(), screen.end(),
							   []( const std::string &line ) { return contains( line, "more hidden" ); } ) );
	BOOST_CHECK_EQUAL( fx.registry->rowCount(), 0 );
}

BOOST_AUTO_TEST_CASE( reset_revives_row )
{
	RegistryFixture fx;
	auto a = fx.bar( 10, "alpha" );
	auto b = fx.bar( 10, "beta" );
	b.finish();
	BOOST_CHECK_EQUAL( fx.registry->activeCount(), 1 );

	b.reset();
	BOOST_CHECK_EQUAL( fx.registry->activeCount(), 2 );
	BOOST_CHECK_EQUAL( *fx.registry->position( b.rowId() ), 1 );
	BOOST_CHECK( !b.isFinished() );
}

BOOST_AUTO_TEST_CASE( plain_stream_gets_final_lines_only )
{
	RegistryFixture fx( false );
	auto bar = fx.bar( 10, "plain" );
	bar.update( 3 );
	fx.registry->flush();
	BOOST_CHECK( fx.out.str().empty() );

	bar.update( 7 );
	bar.finish();
	const auto text = fx.out.str();
	BOOST_CHECK( text.find( '\033' ) == std::string::npos );
	BOOST_CHECK( contains( text, "plain: 100%" ) );
	BOOST_CHECK_EQUAL( std::count( text.begin(), text.end(), '\n' ), 1 );
}

BOOST_AUTO_TEST_CASE( shutdown_finishes_active_bars )
{
	RegistryFixture fx;
	auto a = fx.bar( 10, "alpha" );
	auto b = fx.bar( 10, "beta" );

	fx.registry->shutdown();

	BOOST_CHECK( a.isFinished() );
	BOOST_CHECK( b.isFinished() );
	BOOST_CHECK_EQUAL( fx.registry->activeCount(), 0 );
	BOOST_CHECK_EQUAL( fx.screen().size(), 2 );
}

BOOST_AUTO_TEST_CASE( unregister_finishes_bar )
{
	RegistryFixture fx;
	auto a = fx.bar( 10, "alpha" );
	fx.registry->unregister( a.rowId() );
	BOOST_CHECK( a.isFinished() );
	BOOST_CHECK_EQUAL( fx.registry->activeCount(), 0 );
}

}}
