/*
 * FILE: load_word_lists.cpp
 *
 * WHAT:
 * Implements the word list ingestion pipeline.
 * Each list is read line by line, trimmed, validated, folded to lowercase and
 * appended to a packed buffer that grows with `realloc`. The solution list
 * keeps its file order (it is indexed by day offset); a sorted copy and the
 * sorted valid-guess list serve membership lookups through `bsearch`.
 *
 * CRITICAL DEPENDENCIES:
 * - comparators: `compare_packed_words` is shared by `qsort` and `bsearch`,
 * so both always agree on the ordering.
 */

#include "load_word_lists.h"
#include "comparators.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <stdlib.h>

/* Initial capacity in words; the buffer doubles when full. */
#define INITIAL_WORD_CAPACITY 1024

/*
 * FUNCTION: trim
 *
 * WHAT:
 * Modifies a string in-place to remove trailing whitespace (spaces, tabs,
 * '\n' and '\r').
 */
static void trim(char* str)
{
    char* ptrToWhereNullCharShouldGo = str;
    char* currentPtr = str;
    while (*currentPtr != '\0')
    {
        char ch = *currentPtr++;
        if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r')
        {
            ptrToWhereNullCharShouldGo = currentPtr;
        }
    }
    *ptrToWhereNullCharShouldGo = '\0';
}

/*
 * FUNCTION: normalize_word
 *
 * WHAT:
 * Copies a candidate word into `out` (5 bytes, no terminator) in lowercase.
 * Returns false unless `word` is exactly five ASCII letters.
 */
static bool normalize_word(const char* word, char* out)
{
    if (strlen(word) != (size_t)WORDLE_WORD_LENGTH)
    {
        return false;
    }
    for (int i = 0; i < WORDLE_WORD_LENGTH; i++)
    {
        unsigned char ch = (unsigned char)word[i];
        if (!isalpha(ch) || ch > 127)
        {
            return false;
        }
        out[i] = (char)tolower(ch);
    }
    return true;
}

/*
 * STRUCT: packed_buffer_t
 *
 * WHAT:
 * A growable packed word buffer used while a list is being assembled.
 */
typedef struct _packed_buffer
{
    char* p_words;
    int count;
    int capacity;
} packed_buffer_t;

static bool append_word(packed_buffer_t* p_buffer, const char* packed_word)
{
    if (p_buffer->count == p_buffer->capacity)
    {
        int new_capacity = (p_buffer->capacity == 0) ? INITIAL_WORD_CAPACITY : p_buffer->capacity * 2;
        char* ptr = (char*)realloc(p_buffer->p_words, (size_t)new_capacity * WORDLE_WORD_LENGTH);
        if (ptr == NULL)
        {
            fprintf(stderr, "ERROR: Out of memory growing word list!\n");
            return false;
        }
        p_buffer->p_words = ptr;
        p_buffer->capacity = new_capacity;
    }
    memcpy(p_buffer->p_words + (size_t)p_buffer->count * WORDLE_WORD_LENGTH, packed_word, WORDLE_WORD_LENGTH);
    p_buffer->count++;
    return true;
}

/*
 * FUNCTION: read_word_file
 *
 * WHAT:
 * Reads one word list file into a packed buffer. Blank lines are skipped;
 * any other line that is not a 5-letter word rejects the whole file, with the
 * offending line number reported on stderr.
 */
static bool read_word_file(const char* path, const char* label, packed_buffer_t* p_buffer)
{
    char buffer[100];
    char packed[WORDLE_WORD_LENGTH];
    int line_number = 0;

    FILE* fpIn = fopen(path, "r");
    if (fpIn == NULL)
    {
        fprintf(stderr, "ERROR: Could not open %s file '%s'!\n", label, path);
        return false;
    }

    bool ok = true;
    while (fgets(buffer, sizeof(buffer), fpIn) != NULL)
    {
        line_number++;
        trim(buffer);
        if (buffer[0] == '\0')
        {
            continue;
        }
        if (!normalize_word(buffer, packed))
        {
            fprintf(stderr, "ERROR: %s file '%s' line %d: '%s' is not a 5-letter word.\n", label, path, line_number, buffer);
            ok = false;
            break;
        }
        if (!append_word(p_buffer, packed))
        {
            ok = false;
            break;
        }
    }

    if (ok && ferror(fpIn))
    {
        fprintf(stderr, "ERROR: Failed reading %s file '%s'.\n", label, path);
        ok = false;
    }
    fclose(fpIn);
    return ok;
}

static bool read_word_array(const char* const* words, int count, const char* label, packed_buffer_t* p_buffer)
{
    char packed[WORDLE_WORD_LENGTH];
    for (int i = 0; i < count; i++)
    {
        if (words[i] == NULL || !normalize_word(words[i], packed))
        {
            fprintf(stderr, "ERROR: %s entry %d is not a 5-letter word.\n", label, i);
            return false;
        }
        if (!append_word(p_buffer, packed))
        {
            return false;
        }
    }
    return true;
}

/*
 * FUNCTION: finish_word_lists
 *
 * WHAT:
 * Takes ownership of the two assembled buffers and builds the sorted views.
 * On failure both buffers are released.
 */
static wordle_status_t finish_word_lists(packed_buffer_t* p_solutions, packed_buffer_t* p_guesses, word_lists_t* p_lists)
{
    if (p_solutions->count == 0)
    {
        fprintf(stderr, "ERROR: The solution list is empty!\n");
        free(p_solutions->p_words);
        free(p_guesses->p_words);
        return WORDLE_ERR_WORD_LIST;
    }

    size_t solution_bytes = (size_t)p_solutions->count * WORDLE_WORD_LENGTH;
    char* p_sorted = (char*)malloc(solution_bytes);
    if (p_sorted == NULL)
    {
        fprintf(stderr, "ERROR: Could not allocate space for sorted solutions!\n");
        free(p_solutions->p_words);
        free(p_guesses->p_words);
        return WORDLE_ERR_WORD_LIST;
    }
    memcpy(p_sorted, p_solutions->p_words, solution_bytes);
    qsort(p_sorted, p_solutions->count, WORDLE_WORD_LENGTH, compare_packed_words);

    if (p_guesses->count > 0)
    {
        qsort(p_guesses->p_words, p_guesses->count, WORDLE_WORD_LENGTH, compare_packed_words);
    }

    p_lists->p_solutions = p_solutions->p_words;
    p_lists->p_solutions_sorted = p_sorted;
    p_lists->solution_count = p_solutions->count;
    p_lists->p_valid_guesses = p_guesses->p_words;
    p_lists->valid_guess_count = p_guesses->count;
    return WORDLE_OK;
}

wordle_status_t load_word_lists(const char* solutions_path, const char* valid_guesses_path, word_lists_t* p_lists)
{
    packed_buffer_t solutions = { NULL, 0, 0 };
    packed_buffer_t guesses = { NULL, 0, 0 };

    memset(p_lists, 0, sizeof(*p_lists));

    if (!read_word_file(solutions_path, "solutions", &solutions) ||
        !read_word_file(valid_guesses_path, "valid guesses", &guesses))
    {
        free(solutions.p_words);
        free(guesses.p_words);
        return WORDLE_ERR_WORD_LIST;
    }

    wordle_status_t status = finish_word_lists(&solutions, &guesses, p_lists);
    if (status == WORDLE_OK)
    {
        printf("Loaded %d solutions and %d valid guesses.\n", p_lists->solution_count, p_lists->valid_guess_count);
    }
    return status;
}

wordle_status_t init_word_lists(const char* const* solutions, int solution_count,
    const char* const* valid_guesses, int valid_guess_count,
    word_lists_t* p_lists)
{
    packed_buffer_t solution_buffer = { NULL, 0, 0 };
    packed_buffer_t guess_buffer = { NULL, 0, 0 };

    memset(p_lists, 0, sizeof(*p_lists));

    if (!read_word_array(solutions, solution_count, "Solution", &solution_buffer) ||
        !read_word_array(valid_guesses, valid_guess_count, "Valid guess", &guess_buffer))
    {
        free(solution_buffer.p_words);
        free(guess_buffer.p_words);
        return WORDLE_ERR_WORD_LIST;
    }
    return finish_word_lists(&solution_buffer, &guess_buffer, p_lists);
}

void free_word_lists(word_lists_t* p_lists)
{
    if (p_lists == NULL)
    {
        return;
    }
    free(p_lists->p_solutions);
    free(p_lists->p_solutions_sorted);
    free(p_lists->p_valid_guesses);
    memset(p_lists, 0, sizeof(*p_lists));
}

bool is_word_in_lists(const word_lists_t* p_lists, const char* word)
{
    char key[WORDLE_WORD_LENGTH];
    if (p_lists == NULL || word == NULL || !normalize_word(word, key))
    {
        return false;
    }

    if (p_lists->solution_count > 0 &&
        bsearch(key, p_lists->p_solutions_sorted, p_lists->solution_count, WORDLE_WORD_LENGTH, compare_packed_words) != NULL)
    {
        return true;
    }
    if (p_lists->valid_guess_count > 0 &&
        bsearch(key, p_lists->p_valid_guesses, p_lists->valid_guess_count, WORDLE_WORD_LENGTH, compare_packed_words) != NULL)
    {
        return true;
    }
    return false;
}
