#include "transpiler.hpp"
#include "bibliography.hpp"
#include "latex_escape.hpp"
#include "options.hpp"
#include <unistd.h>  // for access
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include "../lib/log.h"
#include "../lib/file.h"

using namespace mdlatex;

void print_help(const char* prog) {
    printf("mdlatex - markdown to LaTeX body transpiler v1.0\n\n");
    printf("Usage:\n");
    printf("  %s convert <input.md> -o <body.tex> [-b <refs.bib>] [options]\n", prog);
    printf("  %s bib <body.tex> -o <refs.bib>\n", prog);
    printf("  %s escape <text>\n", prog);
    printf("\nUse '%s <command> --help' for command options.\n", prog);
    printf("Logging is configured from ./log.conf when present.\n");
}

static void print_convert_help(const char* prog) {
    printf("mdlatex Converter v1.0\n\n");
    printf("Usage: %s convert <input.md> -o <body.tex> [-b <refs.bib>] [options]\n", prog);
    printf("\nOptions:\n");
    printf("  -o, --output <file>      LaTeX body output (required)\n");
    printf("  -b, --bib <file>         BibTeX output for the cited keys\n");
    printf("  -l, --lang <code>        Document language (en, de, es, fr)\n");
    printf("  -p, --pages <n>          Target page count\n");
    printf("  --figure-window <n>      Figure placeholder lookahead in bytes (default 500)\n");
    printf("  --table-window <n>       Table placeholder lookahead in bytes (default 1000)\n");
    printf("  --chart-window <n>       Chart placeholder lookahead in bytes (default 500)\n");
    printf("  -h, --help               Show this help message\n");
}

static std::string read_input(const char* filename, bool* ok) {
    size_t len = 0;
    char* content = read_text_file(filename, &len);
    if (!content) {
        *ok = false;
        return std::string();
    }
    std::string text(content, len);
    free(content);
    *ok = true;
    return text;
}

static bool write_output(const char* filename, const std::string& content) {
    return write_text_file(filename, content.data(), content.size());
}

static bool positive_arg(int argc, char* argv[], int* i, size_t* out) {
    if (*i + 1 >= argc || !parse_window_size(argv[*i + 1], out)) {
        printf("Error: %s requires a positive number\n", argv[*i]);
        return false;
    }
    (*i)++;
    return true;
}

int exec_convert(int argc, char* argv[]) {
    log_debug("exec_convert called with %d arguments", argc);

    const char* input_file = NULL;
    const char* output_file = NULL;
    const char* bib_file = NULL;
    TranspileOptions options;

    // Skip "convert" and parse remaining arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 < argc) {
                output_file = argv[++i];
            } else {
                printf("Error: -o option requires an output file argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--bib") == 0) {
            if (i + 1 < argc) {
                bib_file = argv[++i];
            } else {
                printf("Error: -b option requires a file argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--lang") == 0) {
            if (i + 1 < argc) {
                options.language = argv[++i];
            } else {
                printf("Error: -l option requires a language code\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--pages") == 0) {
            size_t pages = 0;
            if (!positive_arg(argc, argv, &i, &pages)) return 1;
            options.target_pages = (int)pages;
        } else if (strcmp(argv[i], "--figure-window") == 0) {
            if (!positive_arg(argc, argv, &i, &options.windows.figure)) return 1;
        } else if (strcmp(argv[i], "--table-window") == 0) {
            if (!positive_arg(argc, argv, &i, &options.windows.table)) return 1;
        } else if (strcmp(argv[i], "--chart-window") == 0) {
            if (!positive_arg(argc, argv, &i, &options.windows.chart)) return 1;
        } else if (argv[i][0] != '-') {
            if (input_file == NULL) {
                input_file = argv[i];
            } else {
                printf("Error: Multiple input files not supported\n");
                return 1;
            }
        } else {
            printf("Error: Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }

    if (!input_file) {
        printf("Error: Input file is required\n");
        return 1;
    }
    if (!output_file) {
        printf("Error: Output file (-o) is required\n");
        return 1;
    }
    if (access(input_file, F_OK) != 0) {
        printf("Error: Input file '%s' does not exist\n", input_file);
        return 1;
    }

    bool ok = false;
    std::string markdown = read_input(input_file, &ok);
    if (!ok) {
        printf("Error: Failed to read '%s'\n", input_file);
        return 1;
    }

    TranspileResult result = transpile_markdown(markdown, options);
    if (!result.ok) {
        printf("Error: %s: %s\n", transpile_error_name(result.code), result.error.c_str());
        return 1;
    }
    if (!write_output(output_file, result.latex)) {
        printf("Error: Failed to write '%s'\n", output_file);
        return 1;
    }

    std::vector<BibliographyEntry> entries = synthesize_bibliography(result.citation_keys);
    size_t entry_count = entries.size();
    if (entry_count < result.citation_keys.size()) {
        log_warn("%zu citation key(s) are not author+year and have no bibliography entry",
            result.citation_keys.size() - entry_count);
    }
    if (bib_file && !write_output(bib_file, format_bibtex(entries))) {
        printf("Error: Failed to write '%s'\n", bib_file);
        return 1;
    }

    log_info("converted '%s': %zu characters, %zu bibliography entries, babel language %s",
        input_file, result.latex.size(), entry_count, babel_language(options.language));
    printf("Document length: %zu characters\n", result.latex.size());
    printf("Bibliography entries: %zu\n", entry_count);
    printf("Language: %s\n", babel_language(options.language));
    return 0;
}

int exec_bib(int argc, char* argv[]) {
    const char* input_file = NULL;
    const char* output_file = NULL;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 < argc) {
                output_file = argv[++i];
            } else {
                printf("Error: -o option requires an output file argument\n");
                return 1;
            }
        } else if (argv[i][0] != '-' && input_file == NULL) {
            input_file = argv[i];
        } else {
            printf("Error: Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }
    if (!input_file || !output_file) {
        printf("Usage: mdlatex bib <body.tex> -o <refs.bib>\n");
        return 1;
    }

    bool ok = false;
    std::string body = read_input(input_file, &ok);
    if (!ok) {
        printf("Error: Failed to read '%s'\n", input_file);
        return 1;
    }
    std::string bibtex = generate_bibliography(body);
    if (!write_output(output_file, bibtex)) {
        printf("Error: Failed to write '%s'\n", output_file);
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");
    log_debug("main() started with %d arguments", argc);

    if (argc < 2 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help(argv[0]);
        log_fini();
        return argc < 2 ? 1 : 0;
    }

    int exit_code = 1;
    bool wants_help = argc >= 3 && (strcmp(argv[2], "--help") == 0 || strcmp(argv[2], "-h") == 0);
    if (strcmp(argv[1], "convert") == 0) {
        if (wants_help) {
            print_convert_help(argv[0]);
            exit_code = 0;
        } else {
            exit_code = exec_convert(argc - 1, argv + 1);
        }
        log_debug("exec_convert completed with result: %d", exit_code);
    } else if (strcmp(argv[1], "bib") == 0) {
        if (wants_help) {
            printf("Usage: %s bib <body.tex> -o <refs.bib>\n", argv[0]);
            printf("Synthesizes placeholder BibTeX entries for every \\cite{} key in a LaTeX body.\n");
            exit_code = 0;
        } else {
            exit_code = exec_bib(argc - 1, argv + 1);
        }
    } else if (strcmp(argv[1], "escape") == 0) {
        if (argc != 3) {
            printf("Usage: %s escape <text>\n", argv[0]);
        } else {
            printf("%s\n", escape_latex(argv[2]).c_str());
            exit_code = 0;
        }
    } else {
        printf("Error: Unknown command '%s'\n", argv[1]);
        print_help(argv[0]);
    }

    log_fini();
    return exit_code;
}
