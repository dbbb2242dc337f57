#define BOOST_TEST_MODULE LineFormatterTest
#include <boost/test/unit_test.hpp>
#include "avance/format/line_formatter.hpp"
#include "avance/format/format_utils.hpp"
#include "avance/common/constants.hpp"
#include <algorithm>
#include <limits>

namespace avance {
namespace test {

namespace {

format::BarSnapshot makeSnapshot( uint64_t current, std::optional<uint64_t> total,
								  const std::string &description = "", const std::string &postfix = "" )
{
	format::BarSnapshot snap;
	snap.current = current;
	snap.total = total;
	snap.description = description;
	snap.postfix = postfix;
	return snap;
}

std::chrono::duration<double> seconds( double s )
{
	return std::chrono::duration<double>( s );
}

}

BOOST_AUTO_TEST_CASE( complete_bar_shows_full_percentage_and_zero_eta )
{
	core::StyleConfig style;
	auto line = format::formatLine( makeSnapshot( 100, 100 ), seconds( 10 ), style, 80 );

	BOOST_CHECK_EQUAL( line, "100%|" + std::string( 41, '#' ) + "| 100/100 [00:10<00:00, 10.00it/s]" );
	BOOST_CHECK_EQUAL( format::displayWidth( line ), 80 );
}

BOOST_AUTO_TEST_CASE( half_bar_uses_partial_glyph )
{
	core::StyleConfig style;
	auto line = format::formatLine( makeSnapshot( 50, 100 ), seconds( 10 ), style, 80 );

	BOOST_CHECK_EQUAL( line, " 50%|" + std::string( 21, '#' ) + "5" + std::string( 21, ' ' ) +
					   "| 50/100 [00:10<00:10, 5.00it/s]" );
}

BOOST_AUTO_TEST_CASE( unknown_rate_gives_unknown_eta )
{
	core::StyleConfig style;
	auto line = format::formatLine( makeSnapshot( 0, 10 ), seconds( 0 ), style, 80 );

	BOOST_CHECK( line.find( "| 0/10 [00:00<?, ?it/s]" ) != std::string::npos );
	BOOST_CHECK_EQUAL( line.substr( 0, 5 ), "  0%|" );
}

BOOST_AUTO_TEST_CASE( very_long_eta_is_capped )
{
	core::StyleConfig style;
	const uint64_t huge = std::numeric_limits<uint64_t>::max();
	auto line = format::formatLine( makeSnapshot( 1, huge ), seconds( 1000 ), style, 80 );

	BOOST_CHECK_MESSAGE( line.find( "[16:40<99:59:59, 0.00it/s]" ) != std::string::npos, line );
	BOOST_CHECK( line.find( "<00:00" ) == std::string::npos );
	BOOST_CHECK_EQUAL( line.substr( 0, 5 ), "  0%|" );
}

BOOST_AUTO_TEST_CASE( zero_total_counts_as_complete )
{
	core::StyleConfig style;
	auto line = format::formatLine( makeSnapshot( 0, 0 ), seconds( 1 ), style, 80 );
	BOOST_CHECK_EQUAL( line.substr( 0, 5 ), "100%|" );
	BOOST_CHECK( line.find( "<00:00," ) != std::string::npos );
}

BOOST_AUTO_TEST_CASE( percentage_never_rounds_up_to_complete )
{
	BOOST_CHECK_EQUAL( format::percentComplete( 999, 1000 ), 99 );
	BOOST_CHECK_EQUAL( format::percentComplete( 1, 3 ), 33 );
	BOOST_CHECK_EQUAL( format::percentComplete( 1000, 1000 ), 100 );
	BOOST_CHECK_EQUAL( format::percentComplete( 2000, 1000 ), 100 );

	const auto max = std::numeric_limits<uint64_t>::max();
	BOOST_CHECK_EQUAL( format::percentComplete( max - 1, max ), 99 );
}

BOOST_AUTO_TEST_CASE( description_is_elided_before_numbers )
{
	core::StyleConfig style;
	const std::string description = "a very long description that will not fit";
	auto line = format::formatLine( makeSnapshot( 0, 10, description ), seconds( 0 ), style, 60 );

	BOOST_CHECK_EQUAL( format::displayWidth( line ), 60 );
	BOOST_CHECK_EQUAL( line.substr( 0, 22 ), description.substr( 0, 17 ) + "...: " );
	BOOST_CHECK( line.find( "| 0/10 [00:00<?, ?it/s]" ) != std::string::npos );
	BOOST_CHECK( line.find( "|" + std::string( 10, ' ' ) + "|" ) != std::string::npos ); //bar kept at minimum
}

BOOST_AUTO_TEST_CASE( postfix_follows_rate )
{
	core::StyleConfig style;
	auto line = format::formatLine( makeSnapshot( 100, 100, "", "acc=0.93" ), seconds( 10 ), style, 80 );
	BOOST_CHECK( line.find( "10.00it/s, acc=0.93]" ) != std::string::npos );
	BOOST_CHECK_EQUAL( format::displayWidth( line ), 80 );
}

BOOST_AUTO_TEST_CASE( style_width_caps_terminal_width )
{
	auto style = core::StyleConfig().withWidth( 50 );
	auto line = format::formatLine( makeSnapshot( 5, 10 ), seconds( 1 ), style, 200 );
	BOOST_CHECK_EQUAL( format::displayWidth( line ), 50 );
}

BOOST_AUTO_TEST_CASE( indeterminate_bar_shows_count_and_animation )
{
	core::StyleConfig style;
	auto snap = makeSnapshot( 42, std::nullopt );
	snap.finished = true;
	auto line = format::formatLine( snap, seconds( 2 ), style, 80 );

	BOOST_CHECK_EQUAL( line, "42it |##########| [00:02, 21.00it/s]" );
}

BOOST_AUTO_TEST_CASE( render_bar_glyph_sets )
{
	BOOST_CHECK_EQUAL( format::renderBar( constants::glyphs::ASCII, 0.0, 5 ), "     " );
	BOOST_CHECK_EQUAL( format::renderBar( constants::glyphs::ASCII, 1.0, 5 ), "#####" );
	BOOST_CHECK_EQUAL( format::renderBar( "#", 0.5, 10 ), "#####     " ); //single glyph pads with spaces
	BOOST_CHECK_EQUAL( format::renderBar( constants::glyphs::BALLOON, 0.5, 2 ), "* " );
	BOOST_CHECK_EQUAL( format::displayWidth( format::renderBar( constants::glyphs::BLOCK, 0.37, 20 ) ), 20 );
}

BOOST_AUTO_TEST_CASE( animation_stays_inside_its_track )
{
	for( double t = 0; t < 5; t += 0.125 ) {
		auto frame = format::renderAnimation( constants::glyphs::ASCII, t, false, 10 );
		BOOST_CHECK_EQUAL( frame.size(), 10 );
		BOOST_CHECK_EQUAL( std::count( frame.begin(), frame.end(), '#' ), 3 );
	}
	BOOST_CHECK_EQUAL( format::renderAnimation( constants::glyphs::ASCII, 1.0, true, 10 ), std::string( 10, '#' ) );
}

BOOST_AUTO_TEST_CASE( hidden_rows_line )
{
	BOOST_CHECK_EQUAL( format::formatHiddenRows( 3, 80 ), "... (3 more hidden) ..." );
	BOOST_CHECK_EQUAL( format::formatHiddenRows( 3, 5 ), "... (" );
}

}}
