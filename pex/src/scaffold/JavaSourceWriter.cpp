#include "scaffold/JavaSourceWriter.h"
#include "common/StringHelper.h"
#include <sstream>

namespace PEX {

namespace {

// @PACKAGE@ is replaced with the project package
const char *const APPLICATION_TEMPLATE = R"JAVA(package @PACKAGE@;

import org.springframework.boot.SpringApplication;
import org.springframework.boot.autoconfigure.SpringBootApplication;

@SpringBootApplication
public class Application {

    public static void main(String[] args) {
        SpringApplication.run(Application.class, args);
    }
}
)JAVA";

const char *const PAGE_DATA_SERVICE_TEMPLATE = R"JAVA(package @PACKAGE@.service;

import com.fasterxml.jackson.databind.JsonNode;
import com.fasterxml.jackson.databind.ObjectMapper;
import org.slf4j.Logger;
import org.slf4j.LoggerFactory;
import org.springframework.core.io.ClassPathResource;
import org.springframework.stereotype.Service;

import java.io.IOException;
import java.io.InputStream;
import java.util.LinkedHashMap;
import java.util.Map;

/**
 * Loads page metadata and data sources from classpath:pages/<template>.json.
 */
@Service
public class PageDataService {

    private static final Logger log = LoggerFactory.getLogger(PageDataService.class);

    private final ObjectMapper objectMapper;

    public PageDataService(ObjectMapper objectMapper) {
        this.objectMapper = objectMapper;
    }

    public PageData loadPageData(String templateName) {
        ClassPathResource resource = new ClassPathResource("pages/" + templateName + ".json");
        if (!resource.exists()) {
            log.warn("No page data for {}", templateName);
            return PageData.empty(templateName);
        }

        try (InputStream in = resource.getInputStream()) {
            JsonNode root = objectMapper.readTree(in);

            PageMeta meta = new PageMeta(
                root.path("pageName").asText(templateName),
                root.path("title").asText(templateName),
                root.path("description").asText(""));

            Map<String, Object> dataSources = new LinkedHashMap<>();
            JsonNode sources = root.path("dataSources");
            sources.fields().forEachRemaining(entry ->
                dataSources.put(entry.getKey(), objectMapper.convertValue(entry.getValue(), Object.class)));

            return new PageData(meta, dataSources);
        } catch (IOException e) {
            log.error("Failed to read page data for {}", templateName, e);
            return PageData.empty(templateName);
        }
    }

    public static class PageMeta {
        private final String name;
        private final String title;
        private final String description;

        public PageMeta(String name, String title, String description) {
            this.name = name;
            this.title = title;
            this.description = description;
        }

        public String getName() { return name; }
        public String getTitle() { return title; }
        public String getDescription() { return description; }
    }

    public static class PageData {
        private final PageMeta pageMeta;
        private final Map<String, Object> data;

        public PageData(PageMeta pageMeta, Map<String, Object> data) {
            this.pageMeta = pageMeta;
            this.data = data;
        }

        static PageData empty(String templateName) {
            return new PageData(new PageMeta(templateName, templateName, ""), new LinkedHashMap<>());
        }

        public PageMeta getPageMeta() { return pageMeta; }
        public Map<String, Object> getData() { return data; }
    }
}
)JAVA";

const char *const IMAGE_URL_RESOLVER_TEMPLATE = R"JAVA(package @PACKAGE@.service;

import org.springframework.beans.factory.annotation.Value;
import org.springframework.stereotype.Component;

/**
 * Resolves data-bound image URLs in templates: th:src="${@imageUrlResolver.resolve(item['image'])}".
 *
 * Absolute and data: URLs are returned unchanged, root-relative paths are served
 * locally or through ImageProxyController, and empty values fall back to the
 * placeholder image.
 */
@Component("imageUrlResolver")
public class ImageUrlResolver {

    @Value("${app.image.placeholder:/images/placeholder.svg}")
    private String placeholderImage;

    public String resolve(Object imageUrl) {
        if (imageUrl == null) {
            return placeholderImage;
        }

        String url = imageUrl.toString().trim();
        if (url.isEmpty()) {
            return placeholderImage;
        }
        if (url.startsWith("http://") || url.startsWith("https://") || url.startsWith("data:")) {
            return url;
        }
        if (url.startsWith("//")) {
            return "https:" + url;
        }
        if (url.startsWith("/")) {
            return url;
        }
        if (url.contains(".") && !url.contains("/")) {
            return "https://" + url;
        }
        return "/" + url;
    }

    public String resolveWithFallback(Object imageUrl, Object fallbackUrl) {
        if (imageUrl == null || imageUrl.toString().trim().isEmpty()) {
            return resolve(fallbackUrl);
        }
        return resolve(imageUrl);
    }
}
)JAVA";

const char *const IMAGE_PROXY_CONTROLLER_TEMPLATE = R"JAVA(package @PACKAGE@.controller;

import jakarta.servlet.http.HttpServletRequest;
import org.slf4j.Logger;
import org.slf4j.LoggerFactory;
import org.springframework.beans.factory.annotation.Value;
import org.springframework.boot.web.client.RestTemplateBuilder;
import org.springframework.http.CacheControl;
import org.springframework.http.HttpHeaders;
import org.springframework.http.HttpMethod;
import org.springframework.http.HttpStatus;
import org.springframework.http.MediaType;
import org.springframework.http.ResponseEntity;
import org.springframework.stereotype.Controller;
import org.springframework.web.bind.annotation.GetMapping;
import org.springframework.web.bind.annotation.RequestParam;
import org.springframework.web.client.RestTemplate;

import java.nio.charset.StandardCharsets;
import java.time.Duration;

/**
 * Serves images that are not packaged with the site by fetching them from the image repository.
 *
 * /uploads/** and /api/uploads/** are forwarded to app.image.repository.base-url;
 * /proxy-image?url=... fetches an arbitrary URL found in page data.
 */
@Controller
public class ImageProxyController {

    private static final Logger log = LoggerFactory.getLogger(ImageProxyController.class);

    private final String imageRepositoryBaseUrl;
    private final RestTemplate restTemplate;

    public ImageProxyController(
            @Value("${app.image.repository.base-url:http://localhost:8080}") String imageRepositoryBaseUrl,
            @Value("${app.image.repository.timeout:5000}") int timeoutMs,
            RestTemplateBuilder restTemplateBuilder) {
        this.imageRepositoryBaseUrl = imageRepositoryBaseUrl.replaceAll("/+$", "");
        this.restTemplate = restTemplateBuilder
            .setConnectTimeout(Duration.ofMillis(timeoutMs))
            .setReadTimeout(Duration.ofMillis(timeoutMs))
            .build();
    }

    @GetMapping("/uploads/**")
    public ResponseEntity<byte[]> proxyUploads(HttpServletRequest request) {
        return fetchImage(imageRepositoryBaseUrl + request.getRequestURI());
    }

    @GetMapping("/api/uploads/**")
    public ResponseEntity<byte[]> proxyApiUploads(HttpServletRequest request) {
        return fetchImage(imageRepositoryBaseUrl + request.getRequestURI());
    }

    @GetMapping("/proxy-image")
    public ResponseEntity<byte[]> proxyExternal(@RequestParam String url) {
        String targetUrl = url.startsWith("http://") || url.startsWith("https://") ? url : imageRepositoryBaseUrl + url;
        return fetchImage(targetUrl);
    }

    private ResponseEntity<byte[]> fetchImage(String targetUrl) {
        log.debug("Proxying image {}", targetUrl);
        try {
            ResponseEntity<byte[]> response = restTemplate.exchange(targetUrl, HttpMethod.GET, null, byte[].class);
            byte[] body = response.getBody();
            if (!response.getStatusCode().is2xxSuccessful() || body == null) {
                log.warn("Image not found: {}", targetUrl);
                return ResponseEntity.notFound().build();
            }

            MediaType contentType = response.getHeaders().getContentType();
            HttpHeaders headers = new HttpHeaders();
            headers.setContentType(contentType != null ? contentType : inferContentType(targetUrl));
            headers.setCacheControl(CacheControl.maxAge(Duration.ofDays(7)).cachePublic());
            headers.setContentLength(body.length);
            return new ResponseEntity<>(body, headers, HttpStatus.OK);
        } catch (Exception e) {
            log.error("Failed to proxy image {}: {}", targetUrl, e.getMessage());
            return ResponseEntity.status(HttpStatus.BAD_GATEWAY)
                .body(("Failed to fetch image: " + e.getMessage()).getBytes(StandardCharsets.UTF_8));
        }
    }

    private static MediaType inferContentType(String path) {
        String lowerPath = path.toLowerCase();
        if (lowerPath.endsWith(".png")) {
            return MediaType.IMAGE_PNG;
        } else if (lowerPath.endsWith(".gif")) {
            return MediaType.IMAGE_GIF;
        } else if (lowerPath.endsWith(".webp")) {
            return MediaType.parseMediaType("image/webp");
        } else if (lowerPath.endsWith(".svg")) {
            return MediaType.parseMediaType("image/svg+xml");
        } else if (lowerPath.endsWith(".ico")) {
            return MediaType.parseMediaType("image/x-icon");
        }
        return MediaType.IMAGE_JPEG;
    }
}
)JAVA";

const char *const API_DATA_CONTROLLER_HEAD = R"JAVA(package @PACKAGE@.controller;

import lombok.extern.slf4j.Slf4j;
import org.springframework.http.ResponseEntity;
import org.springframework.web.bind.annotation.CrossOrigin;
import org.springframework.web.bind.annotation.GetMapping;
import org.springframework.web.bind.annotation.RequestParam;
import org.springframework.web.bind.annotation.RestController;

import java.util.ArrayList;
import java.util.HashMap;
import java.util.LinkedHashMap;
import java.util.List;
import java.util.Map;

/**
 * Data endpoints used by the data-bound components of the exported pages.
 *
 * Each endpoint returns sample rows shaped like the components expect. Replace
 * getSampleData with calls into DataService or your repositories.
 */
@Slf4j
@RestController
@CrossOrigin(origins = "*")
public class ApiDataController {
)JAVA";

const char *const API_DATA_CONTROLLER_HELPERS = R"JAVA(
    private Map<String, Object> createItem(long id, String name, String description, double price, String image) {
        Map<String, Object> item = new LinkedHashMap<>();
        item.put("id", id);
        item.put("name", name);
        item.put("description", description);
        item.put("price", price);
        item.put("image", image);
        return item;
    }

    private Map<String, Object> createTeamMember(long id, String name, String role, String avatar, String email) {
        Map<String, Object> member = new LinkedHashMap<>();
        member.put("id", id);
        member.put("name", name);
        member.put("role", role);
        member.put("avatar", avatar);
        member.put("email", email);
        return member;
    }

    private Map<String, Object> createPost(long id, String title, String excerpt, String category, String date) {
        Map<String, Object> post = new LinkedHashMap<>();
        post.put("id", id);
        post.put("title", title);
        post.put("excerpt", excerpt);
        post.put("category", category);
        post.put("date", date);
        return post;
    }

    private Map<String, Object> createTestimonial(long id, String quote, String name, String title, int rating) {
        Map<String, Object> testimonial = new LinkedHashMap<>();
        testimonial.put("id", id);
        testimonial.put("quote", quote);
        testimonial.put("name", name);
        testimonial.put("title", title);
        testimonial.put("rating", rating);
        return testimonial;
    }

    private Map<String, Object> createService(long id, String name, String description, String icon) {
        Map<String, Object> service = new LinkedHashMap<>();
        service.put("id", id);
        service.put("name", name);
        service.put("description", description);
        service.put("icon", icon);
        return service;
    }
}
)JAVA";

const char *const DATA_SERVICE_TEMPLATE = R"JAVA(package @PACKAGE@.service;

import lombok.extern.slf4j.Slf4j;
import org.springframework.stereotype.Service;
import org.springframework.web.client.RestTemplate;

import java.util.Collections;
import java.util.List;
import java.util.Map;

/**
 * Fetches rows for the API endpoints from an external service.
 */
@Slf4j
@Service
public class DataService {

    private final RestTemplate restTemplate = new RestTemplate();

    /**
     * @param apiUrl Full URL of the external API
     * @param dataPath Response key holding the rows; when empty the first list value is used
     */
    @SuppressWarnings("unchecked")
    public List<Map<String, Object>> fetchFromExternalApi(String apiUrl, String dataPath) {
        try {
            log.debug("Fetching {}", apiUrl);
            Map<String, Object> response = restTemplate.getForObject(apiUrl, Map.class);
            if (response == null) {
                return Collections.emptyList();
            }

            if (dataPath != null && !dataPath.isEmpty()) {
                Object rows = response.get(dataPath);
                if (rows instanceof List) {
                    return (List<Map<String, Object>>) rows;
                }
            }
            for (Object value : response.values()) {
                if (value instanceof List) {
                    return (List<Map<String, Object>>) value;
                }
            }
            return Collections.emptyList();
        } catch (Exception e) {
            log.error("Failed to fetch {}", apiUrl, e);
            return Collections.emptyList();
        }
    }
}
)JAVA";

std::string javaLiteral(const std::string &text) {
    return "\"" + StringHelper::escapeJavaString(text) + "\"";
}

}  // namespace

JavaSourceWriter::JavaSourceWriter(const ServerProjectOptions &options) : package_(options.javaPackage()) {}

std::string JavaSourceWriter::application() const {
    return StringHelper::replaceAll(APPLICATION_TEMPLATE, "@PACKAGE@", package_);
}

std::string JavaSourceWriter::pageController(const std::vector<PageRoute> &routes) const {
    std::ostringstream out;
    out << "package " << package_ << ".controller;\n\n"
        << "import " << package_ << ".service.PageDataService;\n"
        << "import " << package_ << ".service.PageDataService.PageData;\n"
        << "import org.springframework.stereotype.Controller;\n"
        << "import org.springframework.ui.Model;\n"
        << "import org.springframework.web.bind.annotation.GetMapping;\n\n"
        << "@Controller\n"
        << "public class PageController {\n\n"
        << "    private final PageDataService pageDataService;\n\n"
        << "    public PageController(PageDataService pageDataService) {\n"
        << "        this.pageDataService = pageDataService;\n"
        << "    }\n";

    for (const auto &route : routes) {
        out << "\n";
        if (route.isHome) {
            out << "    @GetMapping({\"/\", \"/home\"})\n";
        } else {
            out << "    @GetMapping(" << javaLiteral(route.routePath) << ")\n";
        }
        out << "    public String " << route.methodName << "(Model model) {\n"
            << "        return render(" << javaLiteral(route.templateName) << ", model);\n"
            << "    }\n";
    }

    out << "\n"
        << "    private String render(String templateName, Model model) {\n"
        << "        PageData data = pageDataService.loadPageData(templateName);\n"
        << "        data.getData().forEach(model::addAttribute);\n"
        << "        model.addAttribute(\"page\", data.getPageMeta());\n"
        << "        model.addAttribute(\"dataSources\", data.getData());\n"
        << "        return templateName;\n"
        << "    }\n"
        << "}\n";
    return out.str();
}

std::string JavaSourceWriter::pageDataService() const {
    return StringHelper::replaceAll(PAGE_DATA_SERVICE_TEMPLATE, "@PACKAGE@", package_);
}

std::string JavaSourceWriter::imageUrlResolver() const {
    return StringHelper::replaceAll(IMAGE_URL_RESOLVER_TEMPLATE, "@PACKAGE@", package_);
}

std::string JavaSourceWriter::imageProxyController() const {
    return StringHelper::replaceAll(IMAGE_PROXY_CONTROLLER_TEMPLATE, "@PACKAGE@", package_);
}

std::string JavaSourceWriter::sampleRows(SampleKind kind) {
    const std::string pad = "                ";
    std::ostringstream out;
    switch (kind) {
    case SampleKind::Products:
        out << pad << "items.add(createItem(1L, \"Sample Product 1\", \"Description for product 1\", 29.99, \"/images/placeholder.svg\"));\n"
            << pad << "items.add(createItem(2L, \"Sample Product 2\", \"Description for product 2\", 49.99, \"/images/placeholder.svg\"));\n"
            << pad << "items.add(createItem(3L, \"Sample Product 3\", \"Description for product 3\", 79.99, \"/images/placeholder.svg\"));\n";
        break;
    case SampleKind::Team:
        out << pad << "items.add(createTeamMember(1L, \"John Doe\", \"CEO\", \"/images/placeholder.svg\", \"john@example.com\"));\n"
            << pad << "items.add(createTeamMember(2L, \"Jane Smith\", \"CTO\", \"/images/placeholder.svg\", \"jane@example.com\"));\n";
        break;
    case SampleKind::Posts:
        out << pad << "items.add(createPost(1L, \"Sample Blog Post\", \"A short sample excerpt\", \"Technology\", \"2024-01-15\"));\n"
            << pad << "items.add(createPost(2L, \"Another Post\", \"Another sample excerpt\", \"Design\", \"2024-01-10\"));\n";
        break;
    case SampleKind::Testimonials:
        out << pad << "items.add(createTestimonial(1L, \"Great product!\", \"John Smith\", \"CEO, TechCorp\", 5));\n"
            << pad << "items.add(createTestimonial(2L, \"Highly recommended!\", \"Jane Doe\", \"Designer\", 5));\n";
        break;
    case SampleKind::Services:
        out << pad << "items.add(createService(1L, \"Web Development\", \"Custom web applications\", \"\"));\n"
            << pad << "items.add(createService(2L, \"Mobile Apps\", \"iOS and Android development\", \"\"));\n";
        break;
    case SampleKind::Generic:
        out << pad << "items.add(createItem(1L, \"Sample Item 1\", \"Sample description\", 0.0, \"\"));\n"
            << pad << "items.add(createItem(2L, \"Sample Item 2\", \"Sample description\", 0.0, \"\"));\n";
        break;
    }
    return out.str();
}

std::string JavaSourceWriter::apiDataController(const std::vector<ApiEndpointConfig> &endpoints) const {
    std::ostringstream out;
    out << StringHelper::replaceAll(API_DATA_CONTROLLER_HEAD, "@PACKAGE@", package_);

    for (const auto &endpoint : endpoints) {
        out << "\n"
            << "    // " << endpoint.endpoint << ", rows under \"" << endpoint.effectiveDataPath() << "\"\n"
            << "    @GetMapping(" << javaLiteral(endpoint.routePath) << ")\n"
            << "    public ResponseEntity<Map<String, Object>> " << endpoint.methodName << "(\n"
            << "            @RequestParam(required = false) Map<String, String> params) {\n"
            << "        log.debug(\"" << endpoint.methodName << " called with {}\", params);\n"
            << "        List<Map<String, Object>> items = getSampleData(" << javaLiteral(endpoint.methodName)
            << ");\n\n"
            << "        Map<String, Object> response = new HashMap<>();\n"
            << "        response.put(" << javaLiteral(endpoint.effectiveDataPath()) << ", items);\n"
            << "        response.put(\"total\", items.size());\n"
            << "        return ResponseEntity.ok(response);\n"
            << "    }\n";
    }

    out << "\n"
        << "    private List<Map<String, Object>> getSampleData(String endpointMethod) {\n"
        << "        List<Map<String, Object>> items = new ArrayList<>();\n"
        << "        switch (endpointMethod) {\n";
    for (const auto &endpoint : endpoints) {
        out << "            case " << javaLiteral(endpoint.methodName) << ":\n"
            << sampleRows(BackendScaffold::sampleKindFor(endpoint.methodName)) << "                break;\n";
    }
    out << "            default:\n"
        << sampleRows(SampleKind::Generic) << "                break;\n"
        << "        }\n"
        << "        return items;\n"
        << "    }\n";

    out << API_DATA_CONTROLLER_HELPERS;
    return out.str();
}

std::string JavaSourceWriter::dataService() const {
    return StringHelper::replaceAll(DATA_SERVICE_TEMPLATE, "@PACKAGE@", package_);
}

}  // namespace PEX
