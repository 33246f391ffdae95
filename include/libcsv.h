#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Print the processed CSV, or a one-line error message, to stdout.
void processCsv(const char csv[], const char selectedColumns[],
                const char rowFilterDefinitions[]);

void processCsvFile(const char csvFilePath[], const char selectedColumns[],
                    const char rowFilterDefinitions[]);

#ifdef __cplusplus
}
#endif
