#include "CSV/simple_csv.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <charconv>
#include <fstream>
#include <optional>
#include <ranges>
#include <sstream>
#include <system_error>

namespace CSV
{

namespace
{

std::vector<std::string>
split_line( const std::string_view line, const std::string_view delim ) {
    std::vector<std::string> fields;
    for ( const auto field : std::views::split( line, delim ) ) {
        fields.emplace_back( field.begin(), field.end() );
    }
    return fields;
}

// Whole field must be a number, surrounding blanks & a leading '+' allowed
std::optional<double>
parse_value( const std::string & field ) {
    const std::string trimmed{ boost::algorithm::trim_copy( field ) };
    std::string_view  value{ trimmed };
    if ( value.starts_with( '+' ) ) {
        value.remove_prefix( 1 );
    }
    if ( value.empty() ) {
        return std::nullopt;
    }

    double result{ 0. };
    const auto [end, error]{ std::from_chars(
        value.data(), value.data() + value.size(), result ) };
    if ( error != std::errc{} || end != value.data() + value.size() ) {
        return std::nullopt;
    }
    return result;
}

} // namespace

SimpleCSV::SimpleCSV( const std::filesystem::path & filepath,
                      const bool col_titles, const UTIL::Index skip_header,
                      const std::string_view delim ) :
    m_rows( 0 ),
    m_cols( 0 ),
    m_file( filepath ),
    m_col_titles( col_titles ),
    m_skip_header( skip_header ),
    m_delim( delim ) {
    if ( m_delim.empty() ) {
        throw RC::IOError( "CSV delimiter must not be empty." );
    }
    if ( !std::filesystem::directory_entry( m_file ).exists() ) {
        throw RC::IOError(
            std::format( "{} does not exist.", m_file.string() ) );
    }
    parse();
}

void
SimpleCSV::parse() {
    std::ifstream file{ m_file, std::ifstream::binary };
    if ( !file.is_open() ) {
        throw RC::IOError(
            std::format( "Failed to open file {}.", m_file.string() ) );
    }

    std::string line;
    const auto  next_line{ [&file, &line]() {
        if ( !std::getline( file, line ) ) {
            return false;
        }
        if ( !line.empty() && line.back() == '\r' ) {
            line.pop_back();
        }
        return true;
    } };

    // Skip header
    for ( UTIL::Index i{ 0 }; i < m_skip_header; ++i ) {
        if ( !next_line() ) {
            throw RC::IOError( std::format(
                "{} has fewer than {} header lines.", m_file.string(),
                m_skip_header ) );
        }
    }

    // Parse col titles if there are any
    if ( m_col_titles ) {
        if ( !next_line() ) {
            throw RC::IOError( std::format(
                "Failed to parse column titles of {}.", m_file.string() ) );
        }
        m_titles = split_line( line, m_delim );
    }

    UTIL::Index row_count{ 0 };
    while ( next_line() ) {
        if ( line.empty() ) {
            continue;
        }

        const auto fields{ split_line( line, m_delim ) };

        // Without titles the first data row fixes the no. of columns
        if ( m_data.empty() ) {
            if ( m_titles.empty() ) {
                for ( std::size_t i{ 0 }; i < fields.size(); ++i ) {
                    m_titles.push_back( std::to_string( i ) );
                }
            }
            m_data.resize( m_titles.size() );
        }

        // Check no. of vals on row matches expected no.
        if ( fields.size() != m_titles.size() ) {
            throw RC::IOError( std::format(
                "Inconsistent number of columns in {} at data row {} (expected "
                "{}, found {}).",
                m_file.string(), row_count, m_titles.size(), fields.size() ) );
        }

        for ( std::size_t i{ 0 }; i < fields.size(); ++i ) {
            const auto value{ parse_value( fields[i] ) };
            if ( !value ) {
                throw RC::IOError( std::format(
                    "Non-numeric value \"{}\" in {} at data row {}.",
                    fields[i], m_file.string(), row_count ) );
            }
            m_data[i].push_back( *value );
        }
        row_count++;
    }

    for ( std::size_t i{ 0 }; i < m_titles.size(); ++i ) {
        m_title_map[m_titles[i]] = static_cast<UTIL::Index>( i );
    }
    m_data.resize( m_titles.size() );
    m_rows = row_count;
    m_cols = static_cast<UTIL::Index>( m_titles.size() );
}

UTIL::Index
SimpleCSV::col_index( const std::string & title ) const {
    const auto it{ m_title_map.find( title ) };
    if ( it == m_title_map.end() ) {
        throw RC::IOError( std::format( "No column titled \"{}\" in {}.", title,
                                        m_file.string() ) );
    }
    return it->second;
}

void
SimpleCSV::write( const std::filesystem::path &    file,
                  const UTIL::ConstRefMat<double>  m,
                  const std::vector<std::string> & titles ) {
    if ( !titles.empty() && static_cast<UTIL::Index>( titles.size() ) != m.cols() ) {
        throw RC::IOError( std::format(
            "{} titles given for a matrix with {} columns.", titles.size(),
            m.cols() ) );
    }

    std::ofstream fp( file, std::ofstream::out | std::ofstream::binary );
    if ( !fp.is_open() ) {
        throw RC::IOError(
            std::format( "Unable to write to file: {}.", file.string() ) );
    }

    if ( !titles.empty() ) {
        for ( const auto c : titles | std::views::join_with( ',' ) ) {
            fp << c;
        }
        fp << '\n';
    }

    for ( UTIL::Index row{ 0 }; row < m.rows(); ++row ) {
        std::ostringstream line;
        line.precision( 17 );
        for ( UTIL::Index col{ 0 }; col < m.cols(); ++col ) {
            if ( col > 0 ) {
                line << ',';
            }
            line << m( row, col );
        }
        fp << line.str() << '\n';
    }

    if ( !fp ) {
        throw RC::IOError(
            std::format( "Failed while writing {}.", file.string() ) );
    }
}

} // namespace CSV
