// -*- mode: c++ -*-

#ifndef ICEBOUND_BOARD_H
#define ICEBOUND_BOARD_H

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

// The order of the enums is the order in which the search tries the
// moves.
enum Direction {
    UP, DOWN, RIGHT, LEFT,
};

static const int kDirectionCount = 4;

enum Tile {
    OPEN, WALL, PIT, ICE, TELEPORT, EXIT,
};

// The largest width or height of a board. Coordinates are stored in
// 16 bits in the search records.
static const int kMaxDimension = 65535;

inline const char* direction_name(Direction dir) {
    static const char* names[] = { "up", "down", "right", "left" };
    return names[dir];
}

inline char direction_char(Direction dir) {
    static const char chars[] = { 'U', 'D', 'R', 'L' };
    return chars[dir];
}

// A location on a board. (0, 0) is the top left cell of the grid.
struct Position {
    Position() : x_(0), y_(0) {
    }

    Position(int32_t x, int32_t y) : x_(x), y_(y) {
    }

    // Returns the position one step away in the given direction.
    Position step(Direction dir) const {
        static const int dx[] = { 0, 0, 1, -1 };
        static const int dy[] = { -1, 1, 0, 0 };
        return Position(x_ + dx[dir], y_ + dy[dir]);
    }

    bool operator==(const Position& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }

    bool operator!=(const Position& other) const {
        return !(*this == other);
    }

    int32_t x_;
    int32_t y_;
};

enum ParseError {
    PARSE_OK,
    PARSE_EMPTY_INPUT,
    PARSE_MISSING_EXIT,
    PARSE_MISSING_START,
    PARSE_DUPLICATE_START,
    PARSE_UNKNOWN_TILE,
    PARSE_MISSING_TELEPORTER,
    PARSE_EXTRA_TELEPORTER,
    PARSE_RAGGED_ROWS,
    PARSE_EXIT_OUTSIDE_GRID,
    PARSE_BOARD_TOO_LARGE,
    PARSE_TOO_MANY_BOARDS,
};

inline const char* parse_error_string(ParseError err) {
    switch (err) {
    case PARSE_OK: return "ok";
    case PARSE_EMPTY_INPUT: return "empty input";
    case PARSE_MISSING_EXIT: return "no exit marker '*' on the first line";
    case PARSE_MISSING_START: return "no start marker 'R'";
    case PARSE_DUPLICATE_START: return "more than one start marker 'R'";
    case PARSE_UNKNOWN_TILE: return "unknown tile character";
    case PARSE_MISSING_TELEPORTER: return "teleporter without a partner";
    case PARSE_EXTRA_TELEPORTER: return "more than two teleporters";
    case PARSE_RAGGED_ROWS: return "rows of different lengths";
    case PARSE_EXIT_OUTSIDE_GRID: return "exit column outside the grid";
    case PARSE_BOARD_TOO_LARGE: return "board too large";
    case PARSE_TOO_MANY_BOARDS: return "too many boards";
    }
    return "unknown error";
}

class Board;

ParseError parse_board(const char* text, Board* board, Position* start);

// The static part of a puzzle: the tiles of the grid and the exit.
// Immutable once parsed.
//
// The grid is surrounded by walls, except for a single exit cell
// above the top row.
class Board {
public:
    Board() : width_(0), height_(0), exit_(0) {
    }

    int width() const { return width_; }
    int height() const { return height_; }
    int exit_column() const { return exit_; }

    // Returns the tile at the given position. Defined for all
    // positions; anything outside the grid is a wall, except for
    // the exit.
    Tile tile_at(Position p) const {
        if (p.y_ == -1) {
            return p.x_ == exit_ ? EXIT : WALL;
        }
        if (p.y_ < -1 || p.y_ >= height_ || p.x_ < 0 || p.x_ >= width_) {
            return WALL;
        }
        return Tile(tiles_[p.y_ * width_ + p.x_]);
    }

    // Returns the other end of the teleporter at p. May only be
    // called with the position of a teleporter.
    Position teleport_partner(Position p) const {
        return p == teleporters_[0] ? teleporters_[1] : teleporters_[0];
    }

    // Prints the board to stdout. If token is not null, it's drawn
    // at the given position.
    void print(const Position* token) const {
        static const char glyphs[] = { ' ', '.', '~', '-', 'T' };
        for (int x = 0; x < width_; ++x) {
            printf("%c", x == exit_ ? '*' : ' ');
        }
        printf("\n");
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                if (token && *token == Position(x, y)) {
                    printf("R");
                } else {
                    printf("%c", glyphs[tile_at(Position(x, y))]);
                }
            }
            printf("\n");
        }
    }

private:
    friend ParseError parse_board(const char* text, Board* board,
                                  Position* start);

    // The tiles in row-major order.
    std::vector<uint8_t> tiles_;
    int width_;
    int height_;
    // The column of the exit, on the virtual row above the grid.
    int exit_;
    // Both ends of the teleporter, if the board has one.
    Position teleporters_[2];
};

// Constructs a Board from a text description, and finds the start
// position of the token.
//
// The first line marks the exit column with [*]; anything else on
// that line is ignored. Each following line is a row of the grid:
// [ ] is open floor, [.] is a wall, [~] is a pit, [-] is ice, [T] is
// a teleporter (zero or two per board), and [R] is the start
// position of the token, on open floor.
//
// Returns PARSE_OK on success. Otherwise board and start are left
// untouched.
inline ParseError parse_board(const char* text, Board* board,
                              Position* start) {
    if (!text || !*text) {
        return PARSE_EMPTY_INPUT;
    }

    std::vector<std::string> lines;
    for (const char* at = text; *at; ) {
        const char* eol = strchr(at, '\n');
        size_t len = eol ? eol - at : strlen(at);
        std::string line(at, len);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        at += len;
        if (eol) {
            ++at;
        }
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    if (lines.empty()) {
        return PARSE_EMPTY_INPUT;
    }

    size_t exit = lines[0].find('*');
    if (exit == std::string::npos) {
        return PARSE_MISSING_EXIT;
    }

    Board new_board;
    new_board.height_ = lines.size() - 1;
    new_board.width_ = new_board.height_ ? lines[1].size() : 0;
    new_board.exit_ = exit;
    if (new_board.height_ > kMaxDimension ||
        new_board.width_ > kMaxDimension) {
        return PARSE_BOARD_TOO_LARGE;
    }

    int start_count = 0;
    int teleporter_count = 0;
    Position new_start;
    for (int y = 0; y < new_board.height_; ++y) {
        const std::string& row = lines[y + 1];
        if ((int) row.size() != new_board.width_) {
            return PARSE_RAGGED_ROWS;
        }
        for (int x = 0; x < new_board.width_; ++x) {
            Tile tile;
            switch (row[x]) {
            case ' ': tile = OPEN; break;
            case '.': tile = WALL; break;
            case '~': tile = PIT; break;
            case '-': tile = ICE; break;
            case 'T':
                tile = TELEPORT;
                if (teleporter_count < 2) {
                    new_board.teleporters_[teleporter_count] = Position(x, y);
                }
                ++teleporter_count;
                break;
            case 'R':
                tile = OPEN;
                new_start = Position(x, y);
                ++start_count;
                break;
            default:
                return PARSE_UNKNOWN_TILE;
            }
            new_board.tiles_.push_back(tile);
        }
    }

    if (start_count == 0) {
        return PARSE_MISSING_START;
    }
    if (start_count > 1) {
        return PARSE_DUPLICATE_START;
    }
    if (new_board.exit_ >= new_board.width_) {
        return PARSE_EXIT_OUTSIDE_GRID;
    }
    if (teleporter_count == 1) {
        return PARSE_MISSING_TELEPORTER;
    }
    if (teleporter_count > 2) {
        return PARSE_EXTRA_TELEPORTER;
    }

    *board = new_board;
    *start = new_start;
    return PARSE_OK;
}

#endif // ICEBOUND_BOARD_H
