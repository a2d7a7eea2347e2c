#pragma once
#include <string>

// Synthetic extracted-text documents shared by the segmentation tests.
namespace samples {

// Title, author block, six headed sections; the abstract carries one cue sentence.
inline std::string basic_paper() {
    return "A Study of Structure Recovery in Papers\n"
           "Jane Doe, John Smith\n"
           "jane@example.org\n"
           "\n"
           "Abstract\n"
           "We study how research papers can be split into sections. In this paper, we propose a heading "
           "detector for extracted text. It works on plain lines.\n"
           "\n"
           "1. Introduction\n"
           "Scientific documents arrive as flat text after extraction. Recovering their structure helps "
           "readers find the method and results quickly.\n"
           "\n"
           "2. Method\n"
           "The method scores each short line against a table of heading aliases and typographic cues "
           "before resolving duplicates.\n"
           "\n"
           "3. Results\n"
           "Across the test collection the detector recovered nearly every heading while keeping false "
           "positives rare and predictable.\n"
           "\n"
           "4. Conclusion\n"
           "Simple heuristics recover the structure of most papers without any learned model or external "
           "service at all.\n"
           "\n"
           "References\n"
           "[1] A. Author. A reference entry for testing purposes only. 2020.\n";
}

// A table of contents on page 0 repeats every heading with no content under it.
inline std::string paper_with_toc() {
    return "Segmenting Papers With Tables Of Contents\n"
           "\n"
           "Abstract\n"
           "\n"
           "Introduction\n"
           "\n"
           "Method\n"
           "\n"
           "Results\n"
           "\f"
           "Abstract\n"
           "This abstract has more than eight words of real content inside it.\n"
           "\n"
           "Introduction\n"
           "The introduction also has well over eight words of content text.\n"
           "\n"
           "Method\n"
           "The method section describes the approach in more than eight words.\n"
           "\n"
           "Results\n"
           "The results section reports numbers in more than eight words here.\n";
}

// No sentence uses a contribution cue.
inline std::string paper_without_cues() {
    return "Quiet Paper About Nothing Special\n"
           "\n"
           "Abstract\n"
           "Segmentation of documents is a classic problem. Headings are short lines. "
           "Body text is long and flows across lines.\n"
           "\n"
           "Introduction\n"
           "Many tools extract text from portable documents but lose all of the layout on the way.\n";
}

}  // namespace samples
