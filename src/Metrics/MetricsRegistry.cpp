/*
 *  TrustLB, trust-weighted load balancing testbed
 *  Copyright (C) 2026 TrustLB developers
 *
 *  This file is part of TrustLB.
 *
 *  TrustLB is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  TrustLB is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with TrustLB; if not, see <http://www.gnu.org/licenses/>.
 */

#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>
#include <boost/assign/list_of.hpp>
#include "MetricsRegistry.hpp"


const char * MetricsRegistry::contentType = "text/plain; version=0.0.4; charset=utf-8";


namespace {
std::string formatValue(double v) {
    std::ostringstream oss;
    oss << std::setprecision(12) << v;
    return oss.str();
}


std::string escape(const std::string & s) {
    std::string result;
    for (std::string::const_iterator i = s.begin(); i != s.end(); ++i) {
        if (*i == '\\') result += "\\\\";
        else if (*i == '"') result += "\\\"";
        else if (*i == '\n') result += "\\n";
        else result += *i;
    }
    return result;
}


const char * typeName(MetricsRegistry::Type t) {
    switch (t) {
        case MetricsRegistry::COUNTER: return "counter";
        case MetricsRegistry::GAUGE: return "gauge";
        case MetricsRegistry::HISTOGRAM: return "histogram";
    }
    return "untyped";
}
}


const std::vector<double> & MetricsRegistry::getDefaultBuckets() {
    static const std::vector<double> buckets = boost::assign::list_of
            (0.005)(0.01)(0.025)(0.05)(0.075)(0.1)(0.25)(0.5)(0.75)(1.0)(2.5)(5.0)(7.5)(10.0);
    return buckets;
}


void MetricsRegistry::declare(const std::string & name, Type type, const std::string & help,
        const std::vector<double> & buckets) {
    boost::mutex::scoped_lock lock(mutex);
    Family & f = families[name];
    f.type = type;
    f.help = help;
    f.bounds = buckets;
    std::sort(f.bounds.begin(), f.bounds.end());
}


std::string MetricsRegistry::renderLabels(const Labels & labels, const std::string & extraName,
        const std::string & extraValue) {
    if (labels.empty() && extraName.empty()) return std::string();
    std::ostringstream oss;
    oss << '{';
    for (Labels::const_iterator i = labels.begin(); i != labels.end(); ++i) {
        if (i != labels.begin()) oss << ',';
        oss << i->first << "=\"" << escape(i->second) << '"';
    }
    if (!extraName.empty()) {
        if (!labels.empty()) oss << ',';
        oss << extraName << "=\"" << extraValue << '"';
    }
    oss << '}';
    return oss.str();
}


MetricsRegistry::Series & MetricsRegistry::getSeries(const std::string & name, Type type, const Labels & labels) {
    std::map<std::string, Family>::iterator f = families.find(name);
    if (f == families.end() || f->second.type != type)
        throw std::logic_error("metric " + name + " is not a declared " + typeName(type));
    std::string key = renderLabels(labels);
    std::map<std::string, Series>::iterator s = f->second.series.find(key);
    if (s == f->second.series.end()) {
        s = f->second.series.insert(std::make_pair(key, Series())).first;
        s->second.labels = labels;
        s->second.buckets.resize(f->second.bounds.size() + 1, 0);
    }
    return s->second;
}


void MetricsRegistry::increment(const std::string & name, const Labels & labels, double v) {
    boost::mutex::scoped_lock lock(mutex);
    getSeries(name, COUNTER, labels).value += v;
}


void MetricsRegistry::set(const std::string & name, const Labels & labels, double v) {
    boost::mutex::scoped_lock lock(mutex);
    getSeries(name, GAUGE, labels).value = v;
}


void MetricsRegistry::observe(const std::string & name, const Labels & labels, double v) {
    boost::mutex::scoped_lock lock(mutex);
    Series & s = getSeries(name, HISTOGRAM, labels);
    const std::vector<double> & bounds = families[name].bounds;
    // Bucket i counts the values in (bounds[i-1], bounds[i]], the last one is +Inf
    std::size_t i = std::lower_bound(bounds.begin(), bounds.end(), v) - bounds.begin();
    ++s.buckets[i];
    s.sum += v;
    ++s.count;
}


double MetricsRegistry::getValue(const std::string & name, const Labels & labels) const {
    boost::mutex::scoped_lock lock(mutex);
    std::map<std::string, Family>::const_iterator f = families.find(name);
    if (f == families.end()) return 0.0;
    std::map<std::string, Series>::const_iterator s = f->second.series.find(renderLabels(labels));
    if (s == f->second.series.end()) return 0.0;
    return f->second.type == HISTOGRAM ? s->second.count : s->second.value;
}


std::string MetricsRegistry::expose() const {
    boost::mutex::scoped_lock lock(mutex);
    std::ostringstream oss;
    for (std::map<std::string, Family>::const_iterator f = families.begin(); f != families.end(); ++f) {
        const std::string & name = f->first;
        oss << "# HELP " << name << ' ' << f->second.help << '\n';
        oss << "# TYPE " << name << ' ' << typeName(f->second.type) << '\n';
        for (std::map<std::string, Series>::const_iterator s = f->second.series.begin();
                s != f->second.series.end(); ++s) {
            if (f->second.type != HISTOGRAM) {
                oss << name << s->first << ' ' << formatValue(s->second.value) << '\n';
                continue;
            }
            unsigned long cumulative = 0;
            for (std::size_t i = 0; i < f->second.bounds.size(); ++i) {
                cumulative += s->second.buckets[i];
                oss << name << "_bucket" << renderLabels(s->second.labels, "le", formatValue(f->second.bounds[i]))
                    << ' ' << cumulative << '\n';
            }
            oss << name << "_bucket" << renderLabels(s->second.labels, "le", "+Inf") << ' ' << s->second.count << '\n';
            oss << name << "_count" << s->first << ' ' << s->second.count << '\n';
            oss << name << "_sum" << s->first << ' ' << formatValue(s->second.sum) << '\n';
        }
    }
    return oss.str();
}
