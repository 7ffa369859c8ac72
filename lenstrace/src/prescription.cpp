// ============================================================================
// prescription.cpp — Lens prescription parser
// ============================================================================

#include "prescription.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

bool parse_radius(const std::string &token, double &radius)
{
    if (token == "inf" || token == "INF" || token == "flat" || token == "FLAT")
    {
        radius = std::numeric_limits<double>::infinity();
        return true;
    }

    char *end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0')
        return false;
    radius = v;
    return true;
}

bool load_prescription(const char *filename, OpticalSystem &system)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        fprintf(stderr, "ERROR: cannot open lens file: %s\n", filename);
        return false;
    }

    std::string name = "Optical System";
    std::vector<LensRecord> records;
    std::vector<double> gaps;

    bool in_elements = false;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line))
    {
        line_num++;

        // Strip leading whitespace
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);

        // Skip comments
        if (line[0] == '#')
            continue;

        if (!in_elements)
        {
            if (line.substr(0, 5) == "name:")
            {
                name = line.substr(5);
                size_t ns = name.find_first_not_of(" \t");
                size_t ne = name.find_last_not_of(" \t\r");
                name = (ns == std::string::npos) ? "" : name.substr(ns, ne - ns + 1);
                continue;
            }
            if (line.substr(0, 9) == "elements:")
                in_elements = true;
            continue;
        }

        // Expected: r1 r2 thickness diameter n gap_before [material]
        std::istringstream iss(line);
        std::string r1_str, r2_str;
        LensRecord rec;
        double gap = 0.0;

        iss >> r1_str >> r2_str >> rec.thickness >> rec.diameter >> rec.refractive_index >> gap;
        if (iss.fail() || !parse_radius(r1_str, rec.radius_1) ||
            !parse_radius(r2_str, rec.radius_2))
        {
            fprintf(stderr, "WARNING: %s:%d: malformed element line, skipping\n",
                    filename, line_num);
            continue;
        }

        std::string material;
        if (iss >> material && material[0] != '#')
            rec.material = material;

        rec.name = name + " #" + std::to_string(records.size() + 1);
        records.push_back(rec);
        gaps.push_back(gap);
    }

    if (records.empty())
    {
        fprintf(stderr, "ERROR: no elements found in lens file: %s\n", filename);
        return false;
    }

    OpticalSystem out(name);
    for (size_t i = 0; i < records.size(); ++i)
    {
        if (i == 0 && gaps[0] != 0.0)
            fprintf(stderr, "WARNING: gap before the first element is ignored\n");

        std::string error;
        if (!out.add_lens(records[i], gaps[i], &error))
        {
            fprintf(stderr, "ERROR: element %zu: %s\n", i + 1, error.c_str());
            return false;
        }
    }

    system = out;
    return true;
}
