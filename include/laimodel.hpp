#ifndef __LAIMODEL_HPP__
#define __LAIMODEL_HPP__

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "laitools.hpp"
#include "util.hpp"
#include "dates.hpp"
#include "raster.hpp"
#include "reclass.hpp"
#include "normalize.hpp"
#include "statstable.hpp"

namespace laitools {

    namespace lai {

        // How base-period dates are paired with forecast-period dates.
        enum DateMatch {
            Calendar = 0,   // Identical dates.
            DayOfYear = 1   // Identical day of year; the years may differ.
        };

        namespace config {

            // Contains configuration information for a normalization run.
            class L_DLL_EXPORT LaiModelConfig {
            public:

                // The vegetation type raster for the base period.
                std::string baseClasses;

                // The vegetation type raster for the forecast period.
                std::string forecastClasses;

                // The study area boundary (any OGR vector format). If empty,
                // the whole grid is used.
                std::string boundary;

                // Directories of daily LAI rasters with dates in their names.
                std::string baseLaiDir;
                std::string forecastLaiDir;

                // The extension of the LAI rasters, including the dot.
                std::string laiExtension;

                // The directory for normalized rasters, and the prefix of their names.
                std::string outputDir;
                std::string outputPrefix;

                // The statistics table. Defaults to <outputDir>/<outputPrefix>_stats.csv.
                std::string statsFile;

                // The declared vegetation classes.
                VegetationClasses classes;

                // 1-based digit positions kept from raw vegetation codes.
                std::vector<int> digits;

                // Replacements applied after digit selection.
                std::map<int, int> replacements;

                DateMatch match;

                // If true, negative LAI samples are treated as nodata.
                bool negativeAsNodata;

                // The number of threads to use in execution.
                int threads;

                LaiModelConfig();

                // Parse "610=forest,620,..." into the class list.
                void setClasses(const std::string &str);

                // Parse "1,2,3".
                void setDigits(const std::string &str);

                // Parse "611=610,612=610".
                void setReplacements(const std::string &str);

                // "calendar" or "doy".
                void setMatch(const std::string &str);

                // Returns the statistics file path, resolving the default.
                std::string statsPath() const;

                // Returns <outputDir>/<outputPrefix>_classes_<period>.tif, where the
                // reclassified vegetation map of the period is written.
                std::string classesPath(const std::string &period) const;

                // Throws invalid_argument if the configuration is unusable.
                void check() const;

            };

        } // config

        // Produces a raster on demand. Lets the pipeline load each day's
        // raster inside the worker that processes it.
        class L_DLL_EXPORT RasterSource {
        public:
            virtual laitools::raster::MemRaster load() const = 0;
            virtual std::string name() const = 0;
            virtual ~RasterSource();
        };

        class L_DLL_EXPORT FileRasterSource : public RasterSource {
        private:
            std::string m_filename;
            bool m_negativeAsNodata;
        public:
            FileRasterSource(const std::string &filename, bool negativeAsNodata = false);
            laitools::raster::MemRaster load() const;
            std::string name() const;
        };

        class L_DLL_EXPORT MemRasterSource : public RasterSource {
        private:
            laitools::raster::MemRaster m_raster;
            std::string m_name;
        public:
            MemRasterSource(const laitools::raster::MemRaster &raster, const std::string &name = "memory");
            laitools::raster::MemRaster load() const;
            std::string name() const;
        };

        typedef std::map<laitools::util::Date, std::shared_ptr<RasterSource> > DailyCollection;

        // Receives normalized rasters as they are produced. Implementations
        // must tolerate calls from several threads.
        class L_DLL_EXPORT RasterSink {
        public:
            virtual void put(const laitools::util::Date &date, const laitools::raster::MemRaster &raster) = 0;
            virtual ~RasterSink();
        };

        // Writes <dir>/<prefix>_<YYYYDDD>.tif.
        class L_DLL_EXPORT FileRasterSink : public RasterSink {
        private:
            std::string m_dir;
            std::string m_prefix;
        public:
            FileRasterSink(const std::string &dir, const std::string &prefix);
            std::string filename(const laitools::util::Date &date) const;
            void put(const laitools::util::Date &date, const laitools::raster::MemRaster &raster);
        };

        // The outcome of one date.
        class L_DLL_EXPORT DayResult {
        public:
            enum Status {
                Processed = 0,
                Skipped = 1,
                Failed = 2
            };

            laitools::util::Date date;      // The forecast date, or the only date known.
            laitools::util::Date baseDate;  // The matched base date, if any.
            Status status;
            std::string message;            // The skip reason or error message.

            DayResult();
            DayResult(const laitools::util::Date &date, const laitools::util::Date &baseDate,
                Status status, const std::string &message = std::string());

            static std::string statusName(Status status);
        };

        class L_DLL_EXPORT RunSummary {
        public:
            std::vector<DayResult> outcomes;                // Ordered by date.
            std::vector<UndefinedFactorWarning> warnings;   // Ordered by date, then class.

            int processed() const;
            int skipped() const;
            int failed() const;

            // Log one line per skipped or failed date and per warning, then the totals.
            void log() const;
        };

        class L_DLL_EXPORT PipelineResult {
        public:
            std::map<laitools::util::Date, laitools::raster::MemRaster> rasters; // Empty if a sink was used.
            StatsTable table;
            RunSummary summary;
        };

        // Runs alignment, aggregation and normalization for every matched date.
        class L_DLL_EXPORT DailyPipeline {
        private:
            VegetationClasses m_classes;
            DateMatch m_match;
            int m_threads;
            const laitools::util::Callbacks *m_callbacks;
            RasterSink *m_sink;

        public:

            DailyPipeline(const VegetationClasses &classes, DateMatch match = Calendar, int threads = 1);

            void setCallbacks(const laitools::util::Callbacks *callbacks);

            // If set, normalized rasters are handed to the sink as soon as they are
            // computed instead of being kept in the result. A sink failure fails the date.
            void setSink(RasterSink *sink);

            /**
             * Pair the dates of the two collections. Matched pairs are returned in
             * forecast-date order; every unmatched date is appended to skipped.
             *
             * \param baseLai The base-period LAI collection.
             * \param forecastLai The forecast-period LAI collection.
             * \param skipped Receives a result for each unmatched date.
             * \return (base date, forecast date) pairs.
             */
            std::vector<std::pair<laitools::util::Date, laitools::util::Date> > matchDates(
                const DailyCollection &baseLai, const DailyCollection &forecastLai,
                std::vector<DayResult> &skipped) const;

            /**
             * Process every matched date. The class maps and mask are aligned to the base
             * class grid once, before the daily loop; a failure there is thrown. Failures of
             * individual dates are recorded in the summary.
             *
             * \param baseClasses The reclassified base-period class map. Defines the working grid.
             * \param forecastClasses The reclassified forecast-period class map.
             * \param mask The study area mask.
             * \param baseLai The base-period LAI collection.
             * \param forecastLai The forecast-period LAI collection.
             * \param cancel If set to true during the run, the remaining dates are skipped.
             */
            PipelineResult run(const laitools::raster::MemRaster &baseClasses,
                const laitools::raster::MemRaster &forecastClasses,
                const laitools::raster::MemRaster &mask,
                const DailyCollection &baseLai, const DailyCollection &forecastLai,
                bool *cancel = nullptr) const;

        };

        // Runs the whole model from files, as configured.
        class L_DLL_EXPORT LaiModel {
        private:
            const laitools::util::Callbacks *m_callbacks;

        public:
            LaiModel();

            void setCallbacks(const laitools::util::Callbacks *callbacks);

            // Load and reclassify the class maps, build the mask, enumerate the daily
            // rasters, run the pipeline and write the rasters and statistics table.
            RunSummary run(const laitools::lai::config::LaiModelConfig &config, bool *cancel = nullptr);

        };

    } // lai

} // laitools

#endif
