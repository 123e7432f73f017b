#pragma once

#include "RC/RC_errors.hpp"
#include "util/common.hpp"

#include <filesystem>
#include <format>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace CSV
{

// Delimited numeric table, stored column-major
class SimpleCSV
{
    private:
    // Data
    std::map<std::string, UTIL::Index> m_title_map;
    std::vector<std::string>           m_titles;
    std::vector<std::vector<double>>   m_data;
    UTIL::Index                        m_rows;
    UTIL::Index                        m_cols;

    // Parsing information
    std::filesystem::path m_file;
    bool                  m_col_titles;
    UTIL::Index           m_skip_header;
    std::string           m_delim;

    // Parsing, raises RC::IOError
    void parse();

    public:
    explicit SimpleCSV( const std::filesystem::path & filepath,
                        const bool col_titles = false,
                        const UTIL::Index skip_header = 0,
                        const std::string_view delim = "," );

    [[nodiscard]] constexpr inline UTIL::Index rows() const noexcept {
        return m_rows;
    }
    [[nodiscard]] constexpr inline UTIL::Index cols() const noexcept {
        return m_cols;
    }
    // Column titles in file order
    [[nodiscard]] inline const std::vector<std::string> &
    col_titles() const noexcept {
        return m_titles;
    }
    [[nodiscard]] UTIL::Index col_index( const std::string & title ) const;

    template <UTIL::Weight T = double>
    [[nodiscard]] UTIL::Vec<T> colv( const UTIL::Index i ) const {
        if ( i < 0 || i >= m_cols ) {
            throw RC::IOError( std::format(
                "Column {} out of range for {} ({} columns).", i,
                m_file.string(), m_cols ) );
        }
        const auto & column{ m_data[static_cast<std::size_t>( i )] };
        UTIL::Vec<T> result( m_rows );
        for ( UTIL::Index row{ 0 }; row < m_rows; ++row ) {
            result[row] = static_cast<T>( column[static_cast<std::size_t>( row )] );
        }
        return result;
    }

    // Block of the table starting at (row_offset, col_offset)
    template <UTIL::Weight T = double>
    [[nodiscard]] UTIL::Mat<T>
    atv( const UTIL::Index row_offset = 0,
         const UTIL::Index col_offset = 0 ) const {
        if ( row_offset < 0 || row_offset > m_rows || col_offset < 0
             || col_offset > m_cols ) {
            throw RC::IOError( std::format(
                "Offset ({}, {}) out of range for {} ({} x {}).", row_offset,
                col_offset, m_file.string(), m_rows, m_cols ) );
        }

        UTIL::Mat<T> result( m_rows - row_offset, m_cols - col_offset );
        for ( UTIL::Index col{ 0 }; col < result.cols(); ++col ) {
            const auto & column{
                m_data[static_cast<std::size_t>( col_offset + col )]
            };
            for ( UTIL::Index row{ 0 }; row < result.rows(); ++row ) {
                result( row, col ) = static_cast<T>(
                    column[static_cast<std::size_t>( row_offset + row )] );
            }
        }
        return result;
    }

    // Writes m with an optional title row, raises RC::IOError on failure
    static void write( const std::filesystem::path &   file,
                       const UTIL::ConstRefMat<double> m,
                       const std::vector<std::string> & titles = {} );
};

} // namespace CSV
