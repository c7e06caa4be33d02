/*
 * FILE: wordle_status.cpp
 *
 * WHAT:
 * Message table for the status codes declared in wordle_types.h.
 */

#include "wordle_status.h"

const char* wordle_status_message(wordle_status_t status)
{
    switch (status)
    {
    case WORDLE_OK:                 return "OK";
    case WORDLE_ERR_INCOMPLETE_ROW: return "Not enough letters";
    case WORDLE_ERR_UNKNOWN_WORD:   return "Not in word list";
    case WORDLE_ERR_OUT_OF_RANGE:   return "No puzzle is available for this date";
    case WORDLE_ERR_PERSISTENCE:    return "Could not read or write the statistics file";
    case WORDLE_ERR_WORD_LIST:      return "Could not load the word lists";
    case WORDLE_ERR_GAME_OVER:      return "The game is already over";
    case WORDLE_ERR_NOT_FINISHED:   return "The game is not finished yet";
    case WORDLE_ERR_BUFFER:         return "Output buffer too small";
    case WORDLE_ERR_CONFIG:         return "Invalid configuration";
    }
    return "Unknown error";
}
